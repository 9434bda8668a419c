#pragma once
#include <memory>
#include <stdexcept>
#include <type_traits>

#include <wirehair.h>

namespace hashcast::fec_core {

    template <class CPtr, auto delete_function>
    using PtrWithDeleteFunction = std::unique_ptr<
        std::remove_pointer_t<CPtr>,
        std::integral_constant<decltype(delete_function), delete_function>
    >;

    // Owns one wirehair encoder or decoder.
    using CodecHandle = PtrWithDeleteFunction<WirehairCodec, wirehair_free>;

    // wirehair_init() once per process; throws std::runtime_error if the library refuses.
    void ensure_wirehair();

    // "<call>: <wirehair result string>"
    std::runtime_error wirehair_error(const char* call, WirehairResult result);

} // namespace hashcast::fec_core
