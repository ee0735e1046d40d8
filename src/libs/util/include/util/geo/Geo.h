#ifndef UTIL_GEO_GEO_H_
#define UTIL_GEO_GEO_H_

#include "util/geo/Box.h"
#include "util/geo/Line.h"
#include "util/geo/Point.h"

#include <algorithm>
#include <cmath>

namespace util::geo
{

// _____________________________________________________________________________
template<typename T>
inline Box<T> getBoundingBox(const Point<T>& p)
{
    return Box<T>(p, p);
}

// _____________________________________________________________________________
template<typename T>
inline Box<T> getBoundingBox(const Box<T>& b)
{
    return b;
}

// _____________________________________________________________________________
template<typename T>
inline Box<T> extendBox(const Point<T>& p, Box<T> b)
{
    if (p.getX() < b.getLowerLeft().getX()) b.setLowerLeft(Point<T>(p.getX(), b.getLowerLeft().getY()));
    if (p.getY() < b.getLowerLeft().getY()) b.setLowerLeft(Point<T>(b.getLowerLeft().getX(), p.getY()));
    if (p.getX() > b.getUpperRight().getX()) b.setUpperRight(Point<T>(p.getX(), b.getUpperRight().getY()));
    if (p.getY() > b.getUpperRight().getY()) b.setUpperRight(Point<T>(b.getUpperRight().getX(), p.getY()));
    return b;
}

// _____________________________________________________________________________
template<typename T>
inline Box<T> extendBox(const Box<T>& a, Box<T> b)
{
    if (a.isEmpty()) return b;
    b = extendBox(a.getLowerLeft(), b);
    return extendBox(a.getUpperRight(), b);
}

// _____________________________________________________________________________
template<typename T>
inline Box<T> getBoundingBox(const Line<T>& l)
{
    Box<T> ret;
    for (const auto& p : l) ret = extendBox(p, ret);
    return ret;
}

// _____________________________________________________________________________
template<typename T>
inline Box<T> pad(const Box<T>& b, double d)
{
    return Box<T>(Point<T>(b.getLowerLeft().getX() - d, b.getLowerLeft().getY() - d),
                  Point<T>(b.getUpperRight().getX() + d, b.getUpperRight().getY() + d));
}

// _____________________________________________________________________________
template<typename T>
inline bool contains(const Point<T>& p, const Box<T>& b)
{
    return p.getX() >= b.getLowerLeft().getX() && p.getX() <= b.getUpperRight().getX() &&
           p.getY() >= b.getLowerLeft().getY() && p.getY() <= b.getUpperRight().getY();
}

// _____________________________________________________________________________
template<typename T>
inline bool intersects(const Box<T>& b1, const Box<T>& b2)
{
    if (b1.isEmpty() || b2.isEmpty()) return false;
    return b1.getLowerLeft().getX() <= b2.getUpperRight().getX() &&
           b1.getUpperRight().getX() >= b2.getLowerLeft().getX() &&
           b1.getLowerLeft().getY() <= b2.getUpperRight().getY() &&
           b1.getUpperRight().getY() >= b2.getLowerLeft().getY();
}

// _____________________________________________________________________________
template<typename T>
inline bool intersects(const Point<T>& p, const Box<T>& b)
{
    return contains(p, b);
}

// coarse test on the envelope of the line, used for grid cell assignment
// _____________________________________________________________________________
template<typename T>
inline bool intersects(const Line<T>& l, const Box<T>& b)
{
    return intersects(getBoundingBox(l), b);
}

// _____________________________________________________________________________
template<typename T>
inline double dist(const Point<T>& p1, const Point<T>& p2)
{
    return std::sqrt((p1.getX() - p2.getX()) * (p1.getX() - p2.getX()) +
                     (p1.getY() - p2.getY()) * (p1.getY() - p2.getY()));
}

// closest point to p on the segment a-b
// _____________________________________________________________________________
template<typename T>
inline Point<T> projectOn(const Point<T>& a, const Point<T>& p, const Point<T>& b)
{
    double dx = b.getX() - a.getX();
    double dy = b.getY() - a.getY();
    double len = dx * dx + dy * dy;
    if (len == 0) return a;

    double t = ((p.getX() - a.getX()) * dx + (p.getY() - a.getY()) * dy) / len;
    t = std::max(0.0, std::min(1.0, t));
    if (t == 0) return a;
    if (t == 1) return b;
    return Point<T>(a.getX() + t * dx, a.getY() + t * dy);
}

// _____________________________________________________________________________
template<typename T>
inline double distToSegment(const Point<T>& a, const Point<T>& b, const Point<T>& p)
{
    return dist(p, projectOn(a, p, b));
}

}  // namespace util::geo

#endif  // UTIL_GEO_GEO_H_
