#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace astro_compute::core {

using json = nlohmann::json;

// Writes one JSON object per line ("JSON lines") describing compute activity.
class EventEmitter {
public:
    EventEmitter() = default;

    void backend_selected(const std::string& session_id, const std::string& backend,
                          const std::string& device, std::ostream& out);
    void backend_fallback(const std::string& session_id, const std::string& from_backend,
                          const std::string& reason, std::ostream& out);

    void dispatch_start(const std::string& session_id, const std::string& kernel,
                        const std::string& backend, const json& extra, std::ostream& out);
    void dispatch_end(const std::string& session_id, const std::string& kernel,
                      const std::string& backend, double elapsed_ms,
                      const json& extra, std::ostream& out);

    void warning(const std::string& session_id, const std::string& message, std::ostream& out);
    void error(const std::string& session_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& session_id);
};

} // namespace astro_compute::core
