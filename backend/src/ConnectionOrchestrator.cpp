#include "ConnectionOrchestrator.hpp"
#include "DeviceEvents.hpp"
#include "DeviceRegistry.hpp"
#include "Whitelist.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/EventBroadcaster.hpp"
#include "core/LogBuffer.hpp"
#include <condition_variable>
#include <future>
#include <iostream>
#include <system_error>
#include <vector>

namespace bluegate {

using errors::ErrorKind;

const char* to_string(ConnectionState state) {
    return state == ConnectionState::ConnectingBulk ? "ConnectingBulk" : "Idle";
}

// One in-flight radio request. Shared with the completion, which may fire
// after the waiter has given up.
struct ConnectionOrchestrator::Attempt {
    enum class Phase { Pending, Completed, TimedOut };

    std::mutex m;
    std::condition_variable cv;
    Phase phase = Phase::Pending;
    RadioResult result;
    bool applied = false;
};

ConnectionOrchestrator::ConnectionOrchestrator(IRadioAdapter& radio, DeviceRegistry& registry, Whitelist& whitelist,
                                               EventBroadcaster& broadcaster, LogBuffer& log,
                                               OrchestratorOptions options)
: radio_(radio), registry_(registry), whitelist_(whitelist), broadcaster_(broadcaster), log_(log), options_(options) {}

ConnectionState ConnectionOrchestrator::connection_state() const {
    return bulk_guard_.in_flight() ? ConnectionState::ConnectingBulk : ConnectionState::Idle;
}

std::shared_ptr<std::mutex> ConnectionOrchestrator::device_lock(const std::string& address) {
    std::lock_guard<std::mutex> lk(locks_m_);
    auto& slot = device_locks_[address];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

CommandResult ConnectionOrchestrator::connect_one(const std::string& address) {
    // Undiscovered addresses fall through to NotFound in run_attempt.
    if (options_.restrict_to_whitelist && registry_.contains(address) && !whitelist_.contains(address)) {
        std::string msg = errors::format_device_error(ErrorKind::Unauthorized, address, errors::D2120_NOT_WHITELISTED);
        log_.warning(msg, address);
        return CommandResult::fail(ErrorKind::Unauthorized, msg);
    }
    return run_attempt(address, true);
}

CommandResult ConnectionOrchestrator::disconnect_one(const std::string& address) {
    return run_attempt(address, false);
}

CommandResult ConnectionOrchestrator::run_attempt(const std::string& address, bool connect) {
    // Unknown addresses never get a lock slot.
    if (!registry_.contains(address)) {
        std::string msg = errors::format_device_error(ErrorKind::NotFound, address, errors::D2100_NOT_DISCOVERED);
        log_.warning(msg, address);
        return CommandResult::fail(ErrorKind::NotFound, msg);
    }

    auto lock = device_lock(address);
    std::lock_guard<std::mutex> device_guard(*lock);

    std::optional<Device> current = registry_.get(address);
    if (!current) {
        return CommandResult::fail(ErrorKind::NotFound,
            errors::format_device_error(ErrorKind::NotFound, address, errors::D2100_NOT_DISCOVERED));
    }
    const std::optional<std::string> alias = whitelist_.name_of(address);
    const std::string label = alias ? *alias : (current->name.empty() ? address : current->name);

    if (current->connected == connect) {
        return CommandResult::ok(label + (connect ? " already connected" : " already disconnected"));
    }

    uint64_t generation;
    try {
        generation = registry_.begin_attempt(address, connect);
    } catch (const errors::Error& e) {
        return CommandResult::fail(e.kind(), e.what());
    }
    if (connect) {
        log_.info("Connecting to " + label + " (attempt " + std::to_string(current->connection_attempts + 1) + ")",
                  address);
    } else {
        log_.info("Disconnecting from " + label, address);
    }

    auto attempt = std::make_shared<Attempt>();
    const bool authorized_scope = alias.has_value();

    // Only touches the orchestrator while the attempt is Pending, which means
    // run_attempt is still blocked below and everything it references is alive.
    auto done = [this, attempt, address, generation, connect, alias, authorized_scope](RadioResult r) {
        std::lock_guard<std::mutex> lk(attempt->m);
        if (attempt->phase != Attempt::Phase::Pending) {
            std::cerr << "ConnectionOrchestrator: late " << (connect ? "connect" : "disconnect")
                      << " result for " << address << " ignored" << std::endl;
            return;
        }
        attempt->result = r;
        // A failed disconnect still drops the link locally.
        if (r.ok || !connect) {
            try {
                auto committed = registry_.apply_result(address, generation, connect, [&](const Device& d) {
                    DeviceView view = make_view(d, alias);
                    broadcaster_.publish(make_device_list_event(view, authorized_scope));
                    broadcaster_.publish(make_link_event(view));
                });
                attempt->applied = committed.has_value();
            } catch (const errors::Error& e) {
                attempt->result = RadioResult{ false, e.what() };
            }
        }
        attempt->phase = Attempt::Phase::Completed;
        attempt->cv.notify_all();
    };

    try {
        if (connect) radio_.connect(address, done);
        else radio_.disconnect(address, done);
    } catch (const std::exception& e) {
        registry_.invalidate(address, generation);
        std::string msg = errors::format_device_error(ErrorKind::CapabilityFailure, address, e.what());
        log_.error(msg, address);
        return CommandResult::fail(ErrorKind::CapabilityFailure, msg);
    }

    RadioResult result;
    bool applied = false;
    bool timed_out = false;
    {
        std::unique_lock<std::mutex> lk(attempt->m);
        bool finished = attempt->cv.wait_for(lk, options_.connect_timeout, [&attempt]() {
            return attempt->phase != Attempt::Phase::Pending;
        });
        if (!finished) {
            attempt->phase = Attempt::Phase::TimedOut;
            timed_out = true;
        }
        result = attempt->result;
        applied = attempt->applied;
    }

    if (timed_out) {
        // Timed out: nothing from this attempt may land any more.
        registry_.invalidate(address, generation);
        std::string msg = errors::format_device_error(ErrorKind::Timeout, address,
            connect ? errors::D2140_CONNECT_TIMEOUT : errors::D2140_DISCONNECT_TIMEOUT);
        log_.error(msg + " after " + std::to_string(options_.connect_timeout.count()) + " ms", address);
        return CommandResult::fail(ErrorKind::Timeout, msg);
    }

    if (connect) {
        if (!result.ok) {
            std::string msg = errors::format_device_error(ErrorKind::CapabilityFailure, address,
                                                          "connect failed: " + result.error);
            log_.error("Failed to connect to " + label + ": " + result.error, address);
            return CommandResult::fail(ErrorKind::CapabilityFailure, msg);
        }
        if (!applied) {
            std::string msg = errors::format_device_error(ErrorKind::CapabilityFailure, address,
                                                          "connect result superseded");
            log_.warning(msg, address);
            return CommandResult::fail(ErrorKind::CapabilityFailure, msg);
        }
        log_.info("Connected to " + label, address);
        return CommandResult::ok("Connected to " + label);
    }

    if (!result.ok) {
        log_.warning("Disconnect from " + label + " reported an error, marked disconnected: " + result.error, address);
    } else {
        log_.info("Disconnected from " + label, address);
    }
    return CommandResult::ok("Disconnected from " + label);
}

void ConnectionOrchestrator::publish_connection_status(bool connecting, const char* operation) {
    Event ev;
    ev.type = events::CONNECTION_STATUS;
    ev.data = {
        {"is_connecting", connecting},
        {"operation", operation},
        {"connection_state", to_string(connection_state())}
    };
    broadcaster_.publish(ev);
}

BulkResult ConnectionOrchestrator::connect_all() {
    return sweep(true);
}

BulkResult ConnectionOrchestrator::disconnect_all() {
    return sweep(false);
}

BulkResult ConnectionOrchestrator::sweep(bool connect) {
    const char* operation = connect ? "connect_all" : "disconnect_all";
    BulkResult out;

    auto ticket = bulk_guard_.try_acquire();
    if (!ticket) {
        out.success = false;
        out.error = ErrorKind::Busy;
        out.message = "Error " + errors::code_string(errors::E2110_BULK_BUSY) + ": " + errors::D2110_BULK_IN_FLIGHT;
        log_.warning(out.message);
        return out;
    }

    publish_connection_status(true, operation);

    // Whitelist order, restricted to devices discovered at least once.
    std::vector<std::string> targets;
    for (const auto& entry : whitelist_.all()) {
        if (registry_.contains(entry.address)) targets.push_back(entry.address);
    }

    if (targets.empty()) {
        out.success = true;
        out.message = "No authorized devices discovered";
        log_.info(std::string(operation) + ": " + out.message);
    } else {
        log_.info(std::string(connect ? "Connecting " : "Disconnecting ") + std::to_string(targets.size()) +
                  " authorized device(s)");

        std::vector<std::future<CommandResult>> pending;
        pending.reserve(targets.size());
        for (const auto& address : targets) {
            try {
                pending.push_back(std::async(std::launch::async, [this, address, connect]() {
                    return connect ? connect_one(address) : disconnect_one(address);
                }));
            } catch (const std::system_error& e) {
                std::promise<CommandResult> failed;
                failed.set_value(CommandResult::fail(ErrorKind::CapabilityFailure, e.what()));
                pending.push_back(failed.get_future());
            }
        }

        size_t ok = 0;
        for (size_t i = 0; i < targets.size(); ++i) {
            CommandResult r;
            try {
                r = pending[i].get();
            } catch (const std::exception& e) {
                r = CommandResult::fail(ErrorKind::CapabilityFailure, e.what());
            }
            if (r.success) ++ok;
            out.results.push_back(DeviceOutcome{ targets[i], r.success, r.message, r.error });
        }

        out.success = ok == targets.size();
        out.message = std::string(connect ? "Connected " : "Disconnected ") + std::to_string(ok) + " of " +
                      std::to_string(targets.size()) + " authorized device(s)";
        log_.info(out.message);
    }

    ticket.reset();
    publish_connection_status(false, operation);
    return out;
}

} // namespace bluegate
