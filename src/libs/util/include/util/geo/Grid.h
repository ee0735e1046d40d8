// Copyright 2016, University of Freiburg,
// Chair of Algorithms and Data Structures.
// Author: Patrick Brosi <brosi@informatik.uni-freiburg.de>

#ifndef UTIL_GEO_GRID_H_
#define UTIL_GEO_GRID_H_

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "util/geo/Geo.h"

namespace util::geo
{

class GridException : public std::runtime_error
{
public:
    explicit GridException(std::string const& msg) :
        std::runtime_error(msg) {}
};

// Uniform grid over a bounding box. Geometries outside of the box are
// clamped into the border cells, so queries stay coarse but complete.
// Results are candidates only, callers re-check the exact geometry.
template<typename V, template<typename> class G, typename T>
class Grid
{
public:
    static constexpr size_t MAX_CELLS_PER_AXIS = 1024;

    // initialization of a grid with cell width w and cell height h
    // that covers the area of bounding box bbox
    Grid(double w, double h, const Box<T>& bbox) :
        _cellWidth(std::fabs(w)),
        _cellHeight(std::fabs(h)),
        _bb(bbox)
    {
        if (_cellWidth <= 0 || _cellHeight <= 0)
            throw GridException("grid cell size must be positive");

        if (bbox.isEmpty())
        {
            _bb = Box<T>(Point<T>(0, 0), Point<T>(0, 0));
        }

        _width = _bb.getWidth();
        _height = _bb.getHeight();

        _xWidth = std::max<size_t>(1, std::ceil(_width / _cellWidth));
        _yHeight = std::max<size_t>(1, std::ceil(_height / _cellHeight));

        if (_xWidth > MAX_CELLS_PER_AXIS)
        {
            _xWidth = MAX_CELLS_PER_AXIS;
            _cellWidth = _width / _xWidth;
        }
        if (_yHeight > MAX_CELLS_PER_AXIS)
        {
            _yHeight = MAX_CELLS_PER_AXIS;
            _cellHeight = _height / _yHeight;
        }

        _grid.resize(_xWidth);
        for (size_t i = 0; i < _xWidth; i++)
        {
            _grid[i].resize(_yHeight);
        }
    }

    // the empty grid, a single cell around the origin
    Grid() :
        Grid(1, 1, Box<T>(Point<T>(0, 0), Point<T>(0, 0)))
    {
    }

    // add object val with geometry geom to this grid
    void add(const G<T>& geom, const V& val)
    {
        Box<T> box = getBoundingBox(geom);
        if (box.isEmpty()) return;

        size_t swX = getCellXFromX(box.getLowerLeft().getX());
        size_t swY = getCellYFromY(box.getLowerLeft().getY());

        size_t neX = getCellXFromX(box.getUpperRight().getX());
        size_t neY = getCellYFromY(box.getUpperRight().getY());

        for (size_t x = swX; x <= neX; x++)
        {
            for (size_t y = swY; y <= neY; y++)
            {
                add(x, y, val);
            }
        }
    }

    void get(const Box<T>& box, std::set<V>* s) const
    {
        if (box.isEmpty()) return;

        size_t swX = getCellXFromX(box.getLowerLeft().getX());
        size_t swY = getCellYFromY(box.getLowerLeft().getY());

        size_t neX = getCellXFromX(box.getUpperRight().getX());
        size_t neY = getCellYFromY(box.getUpperRight().getY());

        for (size_t x = swX; x <= neX; x++)
        {
            for (size_t y = swY; y <= neY; y++)
            {
                s->insert(_grid[x][y].begin(), _grid[x][y].end());
            }
        }
    }

    void remove(const V& val)
    {
        auto i = _index.find(val);
        if (i == _index.end()) return;

        for (auto pair : i->second)
        {
            _grid[pair.first][pair.second].erase(val);
        }

        _index.erase(i);
    }

    bool contains(const V& val) const
    {
        return _index.count(val) > 0;
    }

    size_t size() const
    {
        return _index.size();
    }

    void clear()
    {
        for (auto& column : _grid)
        {
            for (auto& cell : column) cell.clear();
        }
        _index.clear();
    }

    std::set<std::pair<size_t, size_t>> getCells(const V& val) const
    {
        auto it = _index.find(val);
        if (it == _index.end())
            throw GridException("value not in grid");
        return it->second;
    }

    size_t getXWidth() const
    {
        return _xWidth;
    }
    size_t getYHeight() const
    {
        return _yHeight;
    }

private:
    double _width;
    double _height;

    double _cellWidth;
    double _cellHeight;

    Box<T> _bb;

    size_t _xWidth;
    size_t _yHeight;

    std::vector<std::vector<std::set<V>>> _grid;
    std::map<V, std::set<std::pair<size_t, size_t>>> _index;

    void add(size_t x, size_t y, const V& val)
    {
        _grid[x][y].insert(val);
        _index[val].insert(std::pair<size_t, size_t>(x, y));
    }

    size_t getCellXFromX(double x) const
    {
        double dist = x - _bb.getLowerLeft().getX();
        if (dist <= 0) return 0;
        return std::min<size_t>(_xWidth - 1, std::floor(dist / _cellWidth));
    }
    size_t getCellYFromY(double y) const
    {
        double dist = y - _bb.getLowerLeft().getY();
        if (dist <= 0) return 0;
        return std::min<size_t>(_yHeight - 1, std::floor(dist / _cellHeight));
    }
};

}  // namespace util::geo

#endif  // UTIL_GEO_GRID_H_
