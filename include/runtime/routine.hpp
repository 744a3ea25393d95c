#pragma once

#include <functional>

using Routine = std::function<void()>;
