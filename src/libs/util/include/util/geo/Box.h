// Copyright 2016, University of Freiburg,
// Chair of Algorithms and Data Structures.
// Author: Patrick Brosi <brosi@informatik.uni-freiburg.de>

#ifndef UTIL_GEO_BOX_H_
#define UTIL_GEO_BOX_H_

#include "util/geo/Point.h"

namespace util::geo
{

template<typename T>
class Box
{
public:
    // maximum inverse box as default value of box
    Box() :
        lower_left_(std::numeric_limits<T>::max(), std::numeric_limits<T>::max()),
        upper_right_(std::numeric_limits<T>::lowest(), std::numeric_limits<T>::lowest())
    {}

    Box(const Point<T>& ll, const Point<T>& ur) :
        lower_left_(ll),
        upper_right_(ur)
    {}

    const Point<T>& getLowerLeft() const { return lower_left_; }
    const Point<T>& getUpperRight() const { return upper_right_; }

    void setLowerLeft(const Point<T>& ll) { lower_left_ = ll; }
    void setUpperRight(const Point<T>& ur) { upper_right_ = ur; }

    // an inverse box has not seen a single point yet
    bool isEmpty() const
    {
        return lower_left_.getX() > upper_right_.getX() || lower_left_.getY() > upper_right_.getY();
    }

    T getWidth() const { return upper_right_.getX() - lower_left_.getX(); }
    T getHeight() const { return upper_right_.getY() - lower_left_.getY(); }

    bool operator==(const Box<T>& b) const
    {
        return getLowerLeft() == b.getLowerLeft() &&
               getUpperRight() == b.getUpperRight();
    }

    bool operator!=(const Box<T>& p) const { return !(*this == p); }

private:
    Point<T> lower_left_;
    Point<T> upper_right_;
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const Box<T>& b)
{
    return os << "[" << b.getLowerLeft() << ", " << b.getUpperRight() << "]";
}

}  // namespace util::geo

#endif  // UTIL_GEO_BOX_H_
