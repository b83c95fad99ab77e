#ifndef INCLUDE_GRADEBOX_UTILS_H_
#define INCLUDE_GRADEBOX_UTILS_H_

#include <string>

#include <gradebox/languages.h>
#include <gradebox/sandbox.h>

long GetUniqueExecutionId();

const char* OutcomeToKey(Outcome);
const char* OutcomeToDesc(Outcome);
// terminal outcomes a student may see as a structured result (not a service fault)
bool IsStudentVisible(Outcome);

const char* LanguageId(Language);

// logging
const char* MemoryPolicyName(MemoryPolicy);

#endif  // INCLUDE_GRADEBOX_UTILS_H_
