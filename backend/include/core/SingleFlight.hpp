#pragma once
#include <atomic>
#include <optional>

namespace bluegate {

// At most one holder at a time; contenders are turned away, not queued.
class SingleFlight {
public:
    class Ticket {
    public:
        explicit Ticket(SingleFlight* owner) : owner_(owner) {}
        Ticket(Ticket&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Ticket& operator=(Ticket&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;
        ~Ticket() { release(); }

    private:
        void release() {
            if (owner_) owner_->busy_.store(false);
            owner_ = nullptr;
        }
        SingleFlight* owner_;
    };

    std::optional<Ticket> try_acquire() {
        bool expected = false;
        if (!busy_.compare_exchange_strong(expected, true)) return std::nullopt;
        return Ticket(this);
    }

    bool in_flight() const { return busy_.load(); }

private:
    std::atomic<bool> busy_{false};
};

} // namespace bluegate
