#pragma once

#include <ducat/program/erc20.hpp>
#include <ducat/program/error.hpp>
#include <ducat/program/program.hpp>
#include <ducat/program/system_interface.hpp>
