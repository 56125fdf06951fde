/**
 * @file subject_registry.cpp
 * @brief Explicit template instantiations for SubjectRegistry.
*/

#include "pivot/observer/subject_registry.hpp"
namespace pivot::observer {

    /// One compiled instance per common value type instead of one per TU.

    template class SubjectRegistry<int>;    // WeatherStation
    template class SubjectRegistry<double>; // fractional readings
} // namespace pivot::observer
