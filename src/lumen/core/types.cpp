#include "lumen/core/types.hpp"
#include <cmath>

namespace lumen {

double distance(Point a, Point b)
{
    return std::hypot(b.x - a.x, b.y - a.y);
}

std::optional<Rectangle> Rectangle::intersect(Rectangle const& other) const
{
    int64_t x1 = std::max<int64_t>(x, other.x);
    int64_t y1 = std::max<int64_t>(y, other.y);
    int64_t x2 = std::min(right(), other.right());
    int64_t y2 = std::min(bottom(), other.bottom());

    if (x1 >= x2 || y1 >= y2)
        return std::nullopt;

    return Rectangle{ static_cast<int32_t>(x1),
                      static_cast<int32_t>(y1),
                      static_cast<uint32_t>(x2 - x1),
                      static_cast<uint32_t>(y2 - y1) };
}

Rectangle Rectangle::united(Rectangle const& other) const
{
    if (empty())
        return other;
    if (other.empty())
        return *this;

    int64_t x1 = std::min<int64_t>(x, other.x);
    int64_t y1 = std::min<int64_t>(y, other.y);
    int64_t x2 = std::max(right(), other.right());
    int64_t y2 = std::max(bottom(), other.bottom());

    return Rectangle{ static_cast<int32_t>(x1),
                      static_cast<int32_t>(y1),
                      static_cast<uint32_t>(std::min<int64_t>(x2 - x1, UINT32_MAX)),
                      static_cast<uint32_t>(std::min<int64_t>(y2 - y1, UINT32_MAX)) };
}

Rectangle Rectangle::translated(int32_t dx, int32_t dy) const
{
    auto clamp32 = [](int64_t v)
    { return static_cast<int32_t>(std::clamp<int64_t>(v, INT32_MIN, INT32_MAX)); };
    return { clamp32(static_cast<int64_t>(x) + dx), clamp32(static_cast<int64_t>(y) + dy), width, height };
}

Transform Transform::rotation(OutputRotation rotation)
{
    Transform t;
    switch (rotation)
    {
        case OutputRotation::Normal:
            break;
        case OutputRotation::Rotate90:
            t.m = { { { 0.0, -1.0, 0.0 }, { 1.0, 0.0, 0.0 }, { 0.0, 0.0, 1.0 } } };
            break;
        case OutputRotation::Rotate180:
            t.m = { { { -1.0, 0.0, 0.0 }, { 0.0, -1.0, 0.0 }, { 0.0, 0.0, 1.0 } } };
            break;
        case OutputRotation::Rotate270:
            t.m = { { { 0.0, 1.0, 0.0 }, { -1.0, 0.0, 0.0 }, { 0.0, 0.0, 1.0 } } };
            break;
    }
    return t;
}

Transform Transform::scale(double sx, double sy)
{
    Transform t;
    t.m[0][0] = sx;
    t.m[1][1] = sy;
    return t;
}

Transform Transform::translation(double tx, double ty)
{
    Transform t;
    t.m[0][2] = tx;
    t.m[1][2] = ty;
    return t;
}

Transform Transform::operator*(Transform const& rhs) const
{
    Transform result;
    for (size_t r = 0; r < 3; ++r)
    {
        for (size_t c = 0; c < 3; ++c)
        {
            double sum = 0.0;
            for (size_t k = 0; k < 3; ++k)
                sum += m[r][k] * rhs.m[k][c];
            result.m[r][c] = sum;
        }
    }
    return result;
}

Point Transform::apply(Point p) const
{
    return { m[0][0] * p.x + m[0][1] * p.y + m[0][2], m[1][0] * p.x + m[1][1] * p.y + m[1][2] };
}

bool Transform::is_identity() const
{
    return *this == Transform{};
}

uint32_t bytes_per_pixel(PixelFormat format)
{
    switch (format)
    {
        case PixelFormat::RGB565:
            return 2;
        case PixelFormat::ARGB8888:
        case PixelFormat::XRGB8888:
        case PixelFormat::RGBA8888:
        case PixelFormat::RGBX8888:
        case PixelFormat::ABGR8888:
        case PixelFormat::XBGR8888:
            return 4;
    }
    return 4;
}

bool Buffer::valid() const
{
    if (width == 0 || height == 0)
        return false;

    uint64_t min_stride = static_cast<uint64_t>(width) * bytes_per_pixel(format);
    if (stride < min_stride)
        return false;

    if (data && data->size() < static_cast<uint64_t>(stride) * height)
        return false;

    return true;
}

Rectangle OutputDevice::logical_geometry() const
{
    double scale = scale_factor > 0.0 ? scale_factor : 1.0;
    uint32_t w = width;
    uint32_t h = height;
    if (rotation == OutputRotation::Rotate90 || rotation == OutputRotation::Rotate270)
        std::swap(w, h);

    return { x,
             y,
             static_cast<uint32_t>(std::lround(static_cast<double>(w) / scale)),
             static_cast<uint32_t>(std::lround(static_cast<double>(h) / scale)) };
}

} // namespace lumen
