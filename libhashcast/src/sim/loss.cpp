#include <hashcast/sim/loss.h>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <sstream>

namespace hashcast::sim {

    namespace {

        // Keep packets whose index `pred` rejects, preserving order.
        template <typename Pred>
        PacketStream drop_if_index(PacketStream stream, Pred pred) {
            PacketStream out;
            out.reserve(stream.size());
            for (std::size_t i = 0; i < stream.size(); ++i) {
                if (!pred(i)) out.push_back(std::move(stream[i]));
            }
            return out;
        }

    } // namespace

    PacketStream ShuffleTruncateLoss::transmit(PacketStream stream) {
        std::shuffle(stream.begin(), stream.end(), rng_);
        // erase, not resize: EncodingPacket has no default constructor.
        const std::size_t keep = stream.size() > loss_count_ ? stream.size() - loss_count_ : 0;
        stream.erase(stream.begin() + static_cast<std::ptrdiff_t>(keep), stream.end());
        return stream;
    }

    PacketStream IndexDropLoss::transmit(PacketStream stream) {
        std::vector<std::size_t> sorted = indices_;
        std::sort(sorted.begin(), sorted.end());
        return drop_if_index(std::move(stream), [&](std::size_t i) {
            return std::binary_search(sorted.begin(), sorted.end(), i);
            });
    }

    PacketStream BurstLoss::transmit(PacketStream stream) {
        return drop_if_index(std::move(stream), [&](std::size_t i) {
            return i >= start_ && i - start_ < length_;
            });
    }

    bool BernoulliLoss::drop() noexcept {
        const double p = std::clamp(p_loss_, 0.0, 1.0);
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return rng_.next_unit() < p;
    }

    PacketStream BernoulliLoss::transmit(PacketStream stream) {
        return drop_if_index(std::move(stream), [&](std::size_t) { return drop(); });
    }

    bool GilbertElliottLoss::drop() noexcept {
        const double pg = std::clamp(p_.p_g_to_b, 0.0, 1.0);
        const double pb = std::clamp(p_.p_b_to_g, 0.0, 1.0);
        const double pl = std::clamp(p_.p_loss_bad, 0.0, 1.0);

        // Transition first
        const double u = rng_.next_unit();
        if (!bad_) {
            if (u < pg) bad_ = true;
        }
        else {
            if (u < pb) bad_ = false;
        }

        if (!bad_) return false;
        if (pl <= 0.0) return false;
        if (pl >= 1.0) return true;
        return rng_.next_unit() < pl;
    }

    PacketStream GilbertElliottLoss::transmit(PacketStream stream) {
        return drop_if_index(std::move(stream), [&](std::size_t) { return drop(); });
    }

    PacketStream ReorderingChannel::transmit(PacketStream stream) {
        auto survivors = inner_ ? inner_->transmit(std::move(stream)) : std::move(stream);
        std::shuffle(survivors.begin(), survivors.end(), rng_);
        return survivors;
    }

    std::string ShuffleTruncateLoss::describe() const {
        std::ostringstream os;
        os << name() << " loss=" << loss_count_;
        return os.str();
    }

    std::string IndexDropLoss::describe() const {
        std::ostringstream os;
        os << name() << " drops=" << indices_.size();
        return os.str();
    }

    std::string BurstLoss::describe() const {
        std::ostringstream os;
        os << name() << " start=" << start_ << " length=" << length_;
        return os.str();
    }

    std::string BernoulliLoss::describe() const {
        std::ostringstream os;
        os << name() << " p_loss=" << p_loss_;
        return os.str();
    }

    std::string GilbertElliottLoss::describe() const {
        std::ostringstream os;
        os << name() << " p_g_to_b=" << p_.p_g_to_b << " p_b_to_g=" << p_.p_b_to_g
            << " p_loss_bad=" << p_.p_loss_bad;
        return os.str();
    }

    std::string ReorderingChannel::describe() const {
        return std::string(name()) + " over " + (inner_ ? inner_->describe() : std::string("no loss"));
    }

} // namespace hashcast::sim
