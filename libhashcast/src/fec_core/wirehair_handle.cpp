#include <hashcast/fec_core/wirehair_handle.h>
#include <string>

namespace hashcast::fec_core {

    void ensure_wirehair() {
        static const WirehairResult result = wirehair_init();
        if (result != Wirehair_Success) {
            throw wirehair_error("wirehair_init", result);
        }
    }

    std::runtime_error wirehair_error(const char* call, WirehairResult result) {
        return std::runtime_error(std::string(call) + ": " + wirehair_result_string(result));
    }

} // namespace hashcast::fec_core
