#pragma once

#include <ducat/memory/memory.hpp>
