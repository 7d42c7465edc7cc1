/** @file
 *****************************************************************************

 Implementation of interfaces for cost measurements.

 See measurement.hpp

 *****************************************************************************/

#include "measurement.hpp"

template<typename V>
measurement<V> measurement<V>::exact(const V &value)
{
    return measurement<V>(Exact, value, value);
}

template<typename V>
measurement<V> measurement<V>::range(const V &lower_bound, const V &upper_bound)
{
    return measurement<V>(Range, lower_bound, upper_bound);
}

template<typename V>
measurement<V> measurement<V>::upper_bound(const V &bound)
{
    return measurement<V>(UpperBound, bound, bound);
}

template<typename V>
bool measurement<V>::matches(const V &candidate) const
{
    bool outcome = false;
    switch (kind){
        case Exact:
            outcome = (candidate == first);
            break;
        case Range:
            outcome = (candidate > first && candidate < second);
            break;
        case UpperBound:
            outcome = (candidate < first);
            break;
    }

    if (!outcome){
        std::cerr << candidate << " does not match " << *this << std::endl;
    }
    return outcome;
}

template<typename V>
measurement<V> measurement<V>::compose(const measurement<V> &other) const
{
    switch (kind){
        case Exact:
            if (other.kind == Exact){
                return exact(first + other.first);
            } else if (other.kind == Range){
                return range(first + other.first, first + other.second);
            }
            return upper_bound(first + other.first);
        case Range:
            if (other.kind == Exact){
                return range(first + other.first, second + other.first);
            } else if (other.kind == Range){
                return range(first + other.first, second + other.second);
            }
            return range(first, second + other.first);
        case UpperBound:
            if (other.kind == Range){
                return range(other.first, first + other.second);
            }
            // exact or upper bound
            return upper_bound(first + other.first);
    }
    return *this;
}

template<typename V>
std::ostream& operator<<(std::ostream &out, const measurement<V> &m)
{
    switch (m.kind){
        case measurement<V>::Exact:
            out << "Exact(" << m.first << ")";
            break;
        case measurement<V>::Range:
            out << "Range(" << m.first << ", " << m.second << ")";
            break;
        case measurement<V>::UpperBound:
            out << "UpperBound(" << m.first << ")";
            break;
    }
    return out;
}
