#pragma once

// Visitor built from lambdas, for std::visit()
template <class... Funcs>
struct overloaded : Funcs... {
    using Funcs::operator()...;
};

template <class... Funcs>
overloaded(Funcs...) -> overloaded<Funcs...>;
