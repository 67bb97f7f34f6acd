#pragma once

#include <argparse/argparse.hpp>

namespace arx::driver {

auto BuildCommand(const argparse::ArgumentParser& cmd) -> int;
auto EmitCommand(const argparse::ArgumentParser& cmd) -> int;
auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;
auto InitCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace arx::driver
