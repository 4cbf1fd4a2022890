#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: operator-facing events + reconciliation counters.
 * @details Backed by the shared spdlog logger (see log.hpp).
 */

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "negsync/cluster/objects.hpp"

namespace negsync::obs {

    /** @enum EventType
     *  @brief Event severity as shown to operators.
     */
    enum class EventType : uint8_t { Normal, Warning };

    /** @struct Event
     *  @brief One recorded event against a service.
     */
    struct Event {
        std::string namespace_; ///< Subject namespace
        std::string name;       ///< Subject name
        EventType   type{EventType::Normal};
        std::string reason;     ///< Short CamelCase reason, e.g. "Create"
        std::string message;    ///< Human readable message
    };

    /** @class EventRecorder
     *  @brief Event sink interface. Fire-and-forget: no error path.
     */
    class EventRecorder {
    public:
        virtual ~EventRecorder() = default;

        /// Record a preformatted event.
        virtual void emit(const cluster::Service& subject, EventType type,
                          std::string_view reason, std::string message) = 0;

        /// Format and record an event.
        template <class... Args>
        void eventf(const cluster::Service& subject, EventType type, std::string_view reason,
                    fmt::format_string<Args...> format, Args&&... args) {
            emit(subject, type, reason, fmt::format(format, std::forward<Args>(args)...));
        }
    };

    /** @class MemoryEventRecorder
     *  @brief Keeps every event in memory and mirrors it to the log.
     */
    class MemoryEventRecorder final : public EventRecorder {
    public:
        void emit(const cluster::Service& subject, EventType type,
                  std::string_view reason, std::string message) override;

        /// Copy of the events recorded so far, oldest first.
        std::vector<Event> events() const;

    private:
        mutable std::mutex mu_;
        std::vector<Event> events_;
    };

    /** @struct Counters
     *  @brief Process-level reconciliation counters.
     */
    struct Counters {
        uint64_t passes{0};              ///< Completed sync passes
        uint64_t failed_passes{0};       ///< Passes that returned an error
        uint64_t endpoints_attached{0};  ///< Endpoints added across all passes
        uint64_t endpoints_detached{0};  ///< Endpoints removed across all passes
        uint64_t groups_created{0};      ///< Groups created (fresh or recreated)
        uint64_t groups_deleted{0};      ///< Misconfigured groups deleted
        uint64_t retries_exhausted{0};   ///< Keys that ran out of retry budget
    };

    /** @struct PassRecord
     *  @brief Outcome of one sync pass for one group.
     */
    struct PassRecord {
        std::string neg_name;
        bool        ok{true};
        uint64_t    attached{0};
        uint64_t    detached{0};
        uint64_t    created{0};
        uint64_t    deleted{0};
        std::string error; ///< Empty when ok
    };

    /** @class Observer
     *  @brief Counter sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record the outcome of one sync pass.
        virtual void record(const PassRecord& r) = 0;
        /// Record that a key exhausted its retry budget.
        virtual void record_exhausted(std::string_view key, std::string_view last_error) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide log-backed observer.
    Observer* make_simple_observer();

} // namespace negsync::obs
