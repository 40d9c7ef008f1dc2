#ifndef INCLUDE_GRADEBOX_UTILS_H_
#define INCLUDE_GRADEBOX_UTILS_H_

#include <string>
#include <optional>

#include <gradebox/task.h>
#include <gradebox/outcome.h>
#include <gradebox/submission.h>

long GetUniqueWorkspaceId();

const char* TaskKindName(TaskKind);
std::optional<TaskKind> GetTaskKind(const std::string&);

const char* LanguageName(Language);
std::optional<Language> GetLanguage(const std::string&);

const char* OutcomeTagName(OutcomeTag);
const char* ResponseErrorName(ResponseError);

#endif  // INCLUDE_GRADEBOX_UTILS_H_
