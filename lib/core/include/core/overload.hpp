#pragma once

namespace tidepool::core {

/**
 * @brief Aggregates lambdas into one visitor for std::visit.
 *
 * @code
 * std::visit(overload{ [](const eose &msg) {}, [](const notice &msg) {}, [](const auto &) {} }, message);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace tidepool::core
