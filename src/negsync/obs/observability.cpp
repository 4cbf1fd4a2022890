/**
* @file observability.cpp
 * @brief Log-backed implementations of EventRecorder and Observer.
 */
#include "negsync/obs/observability.hpp"

#include "negsync/obs/log.hpp"

namespace negsync::obs {

    void MemoryEventRecorder::emit(const cluster::Service& subject, EventType type,
                                   std::string_view reason, std::string message) {
        logger()->info("event {}/{} type={} reason={}: {}", subject.namespace_, subject.name,
                       type == EventType::Normal ? "Normal" : "Warning", reason, message);
        std::lock_guard<std::mutex> lk(mu_);
        events_.push_back(Event{subject.namespace_, subject.name, type, std::string(reason), std::move(message)});
    }

    std::vector<Event> MemoryEventRecorder::events() const {
        std::lock_guard<std::mutex> lk(mu_);
        return events_;
    }

    class SimpleObserver : public Observer {
    public:
        void record(const PassRecord& r) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.passes++;
            if (!r.ok) ctr_.failed_passes++;
            ctr_.endpoints_attached += r.attached;
            ctr_.endpoints_detached += r.detached;
            ctr_.groups_created += r.created;
            ctr_.groups_deleted += r.deleted;
            // JSON-ish line for log scrapers
            logger()->info(R"({{"neg":"{}","ok":{},"attached":{},"detached":{},"created":{},"deleted":{},"error":"{}"}})",
                           r.neg_name, r.ok, r.attached, r.detached, r.created, r.deleted, r.error);
        }
        void record_exhausted(std::string_view key, std::string_view last_error) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.retries_exhausted++;
            logger()->error("dropping {} out of the sync queue after exhausting retries: {}", key, last_error);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace negsync::obs
