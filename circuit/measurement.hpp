/** @file
 *****************************************************************************

 Declaration of interfaces for cost measurements

 A measurement is a condition on a measurable quantity, e.g. the number of
 constraints a gadget emits:
 Exact(v): the quantity equals v
 Range(lo, hi): lo < quantity < hi
 UpperBound(b): quantity < b

 Measurements compose: if a satisfies m1 and b satisfies m2, then a + b
 satisfies m1.compose(m2).
 *****************************************************************************/

#ifndef MEASUREMENT_H
#define MEASUREMENT_H

#include <iostream>

template<typename V>
class measurement {
public:
    enum measurement_kind {Exact, Range, UpperBound};

    measurement_kind kind;
    V first;  // exact value, lower bound or upper bound
    V second; // upper bound of a range, unused otherwise

    static measurement<V> exact(const V &value);
    static measurement<V> range(const V &lower_bound, const V &upper_bound);
    static measurement<V> upper_bound(const V &bound);

    // prints the mismatch to std::cerr
    bool matches(const V &candidate) const;

    measurement<V> compose(const measurement<V> &other) const;

private:
    measurement(measurement_kind kind, const V &first, const V &second) :
            kind(kind), first(first), second(second) {}
};

template<typename V>
std::ostream& operator<<(std::ostream &out, const measurement<V> &m);

#include "measurement.tcc"

#endif //MEASUREMENT_H
