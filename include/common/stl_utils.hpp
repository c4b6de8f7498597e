#pragma once

/**
 * @brief 用于 std::visit 的多个 lambda 组合
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
