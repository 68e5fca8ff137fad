#include "astro_compute/core/events.hpp"
#include "astro_compute/core/utils.hpp"

namespace astro_compute::core {

json EventEmitter::base_event(const std::string& type, const std::string& session_id) {
    return {
        {"type", type},
        {"session_id", session_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::backend_selected(const std::string& session_id, const std::string& backend,
                                    const std::string& device, std::ostream& out) {
    json event = base_event("backend_selected", session_id);
    event["backend"] = backend;
    event["device"] = device;
    emit(event, out);
}

void EventEmitter::backend_fallback(const std::string& session_id,
                                    const std::string& from_backend,
                                    const std::string& reason, std::ostream& out) {
    json event = base_event("backend_fallback", session_id);
    event["from"] = from_backend;
    event["to"] = "cpu";
    event["reason"] = reason;
    emit(event, out);
}

void EventEmitter::dispatch_start(const std::string& session_id, const std::string& kernel,
                                  const std::string& backend, const json& extra,
                                  std::ostream& out) {
    json event = base_event("dispatch_start", session_id);
    event["kernel"] = kernel;
    event["backend"] = backend;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::dispatch_end(const std::string& session_id, const std::string& kernel,
                                const std::string& backend, double elapsed_ms,
                                const json& extra, std::ostream& out) {
    json event = base_event("dispatch_end", session_id);
    event["kernel"] = kernel;
    event["backend"] = backend;
    event["elapsed_ms"] = elapsed_ms;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::warning(const std::string& session_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", session_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& session_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", session_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace astro_compute::core
