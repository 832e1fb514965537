#ifndef SERVER_H_
#define SERVER_H_

#include <string>
#include <optional>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <execbox/execution.h>

// Returns an error description if the body is not a well-typed request object
std::optional<std::string> ParseRequestBody(const std::string& body, ExecutionRequest& req);

nlohmann::json ResultToJSON(const ExecutionResult&);
// validation -> 400, infrastructure -> 500, everything else -> 200
int HttpStatus(const ExecutionResult&);
nlohmann::json HealthJSON();
nlohmann::json LanguagesJSON(const LanguageRegistry&);

// Request bodies above this are refused before parsing
size_t MaxPayloadLength(const Config&);

void RegisterRoutes(httplib::Server&, const Orchestrator&, const LanguageRegistry&, const Config&);

// Configure the worker pool and routes, then serve until the server is stopped.
// Returns false if the address cannot be bound.
bool ServerWorkLoop(httplib::Server&, const Orchestrator&, const LanguageRegistry&, const Config&);

#endif  // SERVER_H_
