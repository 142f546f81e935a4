/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Codec, config and transport results are reported as expected<T, E> values.
 * This header gives them a single alias so call sites do not depend on the
 * implementation that happens to be available.
 *
 * - Standard library with P2505 expected: uses <expected>.
 * - Otherwise: falls back to <tl/expected.hpp>, the header-only backport by
 *   TartanLlama (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace swarm_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace swarm_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
