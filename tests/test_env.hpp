#pragma once

// Test-only environment setter taking "NAME=VALUE"; an empty value unsets NAME.
namespace infrar::test {
int put_env(const char* assignment);
}
