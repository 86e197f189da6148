/**
 * @file overloaded.hpp
 * @brief std::visit 用のラムダ合成ヘルパー
 */
#ifndef SPYDIRWEBZ_OVERLOADED_HPP
#define SPYDIRWEBZ_OVERLOADED_HPP

namespace spydirwebz {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace spydirwebz

#endif // SPYDIRWEBZ_OVERLOADED_HPP
