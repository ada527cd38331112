#pragma once

#include <ducat/encode/hex.hpp>
