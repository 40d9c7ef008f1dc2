#ifndef INCLUDE_GRADEBOX_JSON_H_
#define INCLUDE_GRADEBOX_JSON_H_

#include <string>

#include <nlohmann/json.hpp>

#include <gradebox/task.h>
#include <gradebox/prober.h>
#include <gradebox/outcome.h>
#include <gradebox/submission.h>

nlohmann::json OutcomeJSON(const Outcome&);
nlohmann::json ResponseJSON(const GradeResponse&);
nlohmann::json SubmissionJSON(const Submission&);
nlohmann::json ToolchainJSON(const ToolchainStatus&);
nlohmann::json StatsJSON(const TaskStats&);

// Return false and set message on malformed input. ParseTask also
// rejects tasks violating the write/review field invariant.
bool ParseTask(const nlohmann::json&, Task&, std::string& message);
bool ParseRequest(const nlohmann::json&, SubmissionRequest&, std::string& message);

#endif  // INCLUDE_GRADEBOX_JSON_H_
