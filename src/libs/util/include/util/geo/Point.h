#ifndef UTIL_GEO_POINT_H_
#define UTIL_GEO_POINT_H_

#include <cstddef>
#include <functional>
#include <limits>
#include <ostream>

namespace util::geo
{

template<typename T>
class Point
{
public:
    Point() :
        x_(0), y_(0)
    {}

    Point(T x, T y) :
        x_(x), y_(y)
    {}

    T getX() const { return x_; }
    T getY() const { return y_; }

    void setX(T x) { x_ = x; }
    void setY(T y) { y_ = y; }

    Point<T> operator+(const Point<T>& p) const
    {
        return Point<T>(x_ + p.getX(), y_ + p.getY());
    }

    Point<T> operator-(const Point<T>& p) const
    {
        return Point<T>(x_ - p.getX(), y_ - p.getY());
    }

    // exact coordinate equality
    bool operator==(const Point<T>& p) const
    {
        return p.getX() == x_ && p.getY() == y_;
    }

    bool operator!=(const Point<T>& p) const { return !(*this == p); }

    bool operator<(const Point<T>& p) const
    {
        return x_ < p.getX() || (x_ == p.getX() && y_ < p.getY());
    }

private:
    T x_, y_;
};

template<typename T>
struct PointHash
{
    size_t operator()(const Point<T>& p) const
    {
        size_t h = std::hash<T>()(p.getX());
        h ^= std::hash<T>()(p.getY()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const Point<T>& p)
{
    return os << "(" << p.getX() << ", " << p.getY() << ")";
}

}  // namespace util::geo

#endif  // UTIL_GEO_POINT_H_
