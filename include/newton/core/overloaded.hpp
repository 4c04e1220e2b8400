#pragma once

/// @file overloaded.hpp
/// @brief Lambda overload set for std::visit

namespace newton_core {

template<class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace newton_core
