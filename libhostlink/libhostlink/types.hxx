#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hostlink
{
  using std::size_t;

  using std::int64_t;
  using std::uint64_t;

  using std::cerr;
  using std::endl;

  using std::string;

  using std::array;
  using std::map;
  using std::vector;
  using std::optional;
  using std::nullopt;

  using std::function;
  using std::forward;
  using std::move;

  using std::unique_ptr;
  using std::make_unique;

  using std::exception;
  using std::exception_ptr;
  using std::logic_error;
  using std::runtime_error;
  using std::invalid_argument;

  namespace fs = std::filesystem;
}
