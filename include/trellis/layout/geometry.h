#pragma once
#include <algorithm>
#include <string>

namespace trellis::layout {

enum class Dim {
    X,
    Y
};

inline Dim other_dim(Dim d) { return d == Dim::X ? Dim::Y : Dim::X; }
inline const char* dim_name(Dim d) { return d == Dim::X ? "x" : "y"; }

struct Vec2 {
    float x = 0, y = 0;

    float dim(Dim d) const { return d == Dim::X ? x : y; }
    void set_dim(Dim d, float v) {
        if (d == Dim::X) x = v; else y = v;
    }
    void add_dim(Dim d, float v) { set_dim(d, dim(d) + v); }
    void set_max_dim(Dim d, float v) { set_dim(d, std::max(dim(d), v)); }

    // Componentwise max against other
    void set_max(const Vec2& o) {
        x = std::max(x, o.x);
        y = std::max(y, o.y);
    }
    // Componentwise min, only against positive components of o
    void set_min_pos(const Vec2& o) {
        if (o.x > 0) x = std::min(x, o.x);
        if (o.y > 0) y = std::min(y, o.y);
    }
    void add_scalar(float v) {
        x += v;
        y += v;
    }

    bool is_zero() const { return x == 0 && y == 0; }

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2& operator+=(const Vec2& o) {
        x += o.x;
        y += o.y;
        return *this;
    }
    bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const { return !(*this == o); }

    std::string to_string() const;
};

// Integer (col, row) pair used by grid layouts
struct GridPoint {
    int x = 0, y = 0;

    int dim(Dim d) const { return d == Dim::X ? x : y; }
    bool operator==(const GridPoint& o) const { return x == o.x && y == o.y; }
};

} // namespace trellis::layout
