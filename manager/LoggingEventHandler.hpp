// LoggingEventHandler.hpp - Event handler used by the spaman host executable
#pragma once

#include "spa/ISpaEventHandler.hpp"
#include "logger.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace spaman {

/**
 * \brief Host-side handler that reports lifecycle events through the logger.
 * \ingroup spaman_module
 *
 * Progress events are logged at debug, milestones (discovery results, connection outcome)
 * at info, faults at warning. Keeps per-event counters for the shutdown summary.
 */
class LoggingEventHandler : public spa::ISpaEventHandler {
public:
    /**
     * \param spa_name Configured spa name, used to word "not found" reports.
     * \param status_provider Returns the manager's status line, logged with each milestone.
     */
    LoggingEventHandler(std::shared_ptr<Logger> logger,
                        std::optional<std::string> spa_name,
                        std::function<std::string()> status_provider = {});

    Task<void> handle_event(spa::SpaEvent event, const spa::SpaEventPayload& payload) override;

    size_t event_count(spa::SpaEvent event) const;
    size_t total_events() const { return total_events_; }
    std::string format_summary() const;

private:
    std::string status() const;

    std::shared_ptr<Logger> logger_;
    std::optional<std::string> spa_name_;
    std::function<std::string()> status_provider_;
    std::map<spa::SpaEvent, size_t> counts_;
    size_t total_events_{0};
};

} // namespace spaman
