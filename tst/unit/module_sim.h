//
// Simulate the Valkey Module Environment
//
#ifndef VALKEYJSONPATCH_TST_UNIT_MODULE_SIM_H_
#define VALKEYJSONPATCH_TST_UNIT_MODULE_SIM_H_

#include <cstddef>
#include <string>

void setupValkeyModulePointers();
std::string test_getLogText();

#endif  // VALKEYJSONPATCH_TST_UNIT_MODULE_SIM_H_
