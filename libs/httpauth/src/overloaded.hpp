#pragma once

namespace httpauth
{

template <class... _T>
struct Overloaded : _T...
{
    using _T::operator()...;
};

template <class... _T>
Overloaded(_T...) -> Overloaded<_T...>;

}
