#include "Color.h"
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace tessel {

static std::optional<Color> parseHexColor(const char* color, std::size_t sz)
{
    if ((sz == 4 || sz == 5 || sz == 7 || sz == 9) && color[0] == '#') {
        // strtoul would take a sign or leading space
        for (std::size_t i = 1; i < sz; ++i) {
            if (!isxdigit(static_cast<unsigned char>(color[i]))) {
                return {};
            }
        }
        char* end;
        const auto n = strtoul(color + 1, &end, 16);
        if (*end == '\0') {
            switch (sz) {
            case 4:
                // #rgb
                return Color {
                    ((n >> 8) & 0xf) / 15.f,
                    ((n >> 4) & 0xf) / 15.f,
                    ((n >> 0) & 0xf) / 15.f,
                    1.f
                };
            case 5:
                return Color {
                    ((n >> 12) & 0xf) / 15.f,
                    ((n >> 8) & 0xf) / 15.f,
                    ((n >> 4) & 0xf) / 15.f,
                    ((n >> 0) & 0xf) / 15.f
                };
            case 7:
                return Color {
                    ((n >> 16) & 0xff) / 255.f,
                    ((n >> 8) & 0xff) / 255.f,
                    ((n >> 0) & 0xff) / 255.f,
                    1.f
                };
            case 9:
                return Color {
                    ((n >> 24) & 0xff) / 255.f,
                    ((n >> 16) & 0xff) / 255.f,
                    ((n >> 8) & 0xff) / 255.f,
                    ((n >> 0) & 0xff) / 255.f
                };
            }
        }
    }
    return {};
}

// rgb(255, 0, 0) or rgba(255, 0, 0, 0.5)
static std::optional<Color> parseFunctionColor(const char* color, std::size_t sz)
{
    std::size_t expected;
    const char* cur;
    if (sz > 5 && strncmp(color, "rgba(", 5) == 0) {
        expected = 4;
        cur = color + 5;
    } else if (sz > 4 && strncmp(color, "rgb(", 4) == 0) {
        expected = 3;
        cur = color + 4;
    } else {
        return {};
    }

    std::array<float, 4> components = { 0.f, 0.f, 0.f, 1.f };
    for (std::size_t i = 0; i < expected; ++i) {
        char* end;
        const float value = strtof(cur, &end);
        if (end == cur || !std::isfinite(value)) {
            return {};
        }
        components[i] = value;
        cur = end;
        while (isspace(static_cast<unsigned char>(*cur))) {
            ++cur;
        }
        const char sep = i + 1 < expected ? ',' : ')';
        if (*cur != sep) {
            return {};
        }
        ++cur;
    }
    while (isspace(static_cast<unsigned char>(*cur))) {
        ++cur;
    }
    if (*cur != '\0') {
        return {};
    }
    return Color {
        components[0] / 255.f,
        components[1] / 255.f,
        components[2] / 255.f,
        components[3]
    };
}

std::optional<Color> parseColor(const std::string& color)
{
    if (color.empty()) {
        return {};
    }
    if (color[0] == '#') {
        return parseHexColor(color.c_str(), color.size());
    }
    return parseFunctionColor(color.c_str(), color.size());
}

Color premultiplied(const Color& color)
{
    return Color {
        color.r * color.a,
        color.g * color.a,
        color.b * color.a,
        color.a
    };
}

Color mix(const Color& from, const Color& to, float t)
{
    return Color {
        from.r + (to.r - from.r) * t,
        from.g + (to.g - from.g) * t,
        from.b + (to.b - from.b) * t,
        from.a + (to.a - from.a) * t
    };
}

} // namespace tessel
