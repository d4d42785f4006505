#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "Device.hpp"

namespace bluegate {

struct RadioResult {
    bool ok = false;
    std::string error;
};

/**
 * @brief Lazy, unbounded sequence of discovery sightings.
 *
 * One stream is opened per active scan mode and consumed by a single thread.
 */
class DiscoveryStream {
public:
    virtual ~DiscoveryStream() = default;
    /**
     * @brief Wait up to `wait` for the next sighting.
     * @return std::nullopt when nothing arrived or the stream was cancelled.
     * @throws errors::Error(CapabilityFailure) when the radio can no longer scan.
     */
    virtual std::optional<Sighting> next(std::chrono::milliseconds wait) = 0;
    /** @brief Wake any blocked next() and end the sequence. Safe from any thread. */
    virtual void cancel() = 0;
};

/**
 * @brief Opaque discovery/connect capability of the underlying radio stack.
 *
 * To add a new radio backend:
 *  1. Inherit from IRadioAdapter and implement all pure virtual methods.
 *  2. Completions may run on any thread, and may arrive after the caller
 *     stopped waiting; they must still be invoked exactly once.
 *  3. Construct it in main.cpp and hand it to Backend.
 */
class IRadioAdapter {
public:
    using Completion = std::function<void(RadioResult)>;

    virtual ~IRadioAdapter() = default;
    /** @brief Adapter name (for logging) */
    virtual std::string name() const = 0;
    /** @brief Begin discovery; throws errors::Error(CapabilityFailure) if the radio is unavailable */
    virtual std::unique_ptr<DiscoveryStream> open_discovery() = 0;
    /** @brief Start establishing a link; `done` reports the outcome */
    virtual void connect(const std::string& address, Completion done) = 0;
    /** @brief Start tearing down a link; `done` reports the outcome */
    virtual void disconnect(const std::string& address, Completion done) = 0;
    /** @brief Blocking check whether `address` is in range */
    virtual std::optional<Sighting> probe(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

} // namespace bluegate
