#pragma once

#include <memory>

namespace waypoint
{

//! Stateless deleter that hands a C object back to the library's free function.
template <auto FreeFunction>
struct FreeWith
{
    template <typename Object>
    void operator()(Object* object) const noexcept
    {
        if (object != nullptr)
        {
            FreeFunction(object);
        }
    }
};

//! Owns a libxml2 document, an SDL surface or any other C object released by
//! a single free function, e.g. Handle<xmlDoc, xmlFreeDoc>.
template <typename Object, auto FreeFunction>
using Handle = std::unique_ptr<Object, FreeWith<FreeFunction>>;

} // namespace waypoint
