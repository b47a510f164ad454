#pragma once

#include <Color.h>
#include <Geometry.h>
#include <TextMeasurer.h>
#include <optional>
#include <string>
#include <vector>

namespace tessel {

struct Primitive
{
    enum class Type {
        FillRect,
        StrokeRect,
        Text
    };

    Type type = Type::FillRect;
    // local coordinates, transform maps them to the window
    Rect rect = {};
    Affine transform = {};
    // window coordinates
    std::optional<Rect> clip;
    // premultiplied
    Color color = {};
    float radius = 0.f;
    float strokeWidth = 0.f;
    std::string text;
    FontAttributes font;
};

/* Canvas

   records draw primitives for a frame. a backend walks primitives() and
   renders them, nothing here touches the gpu.
*/

class Canvas
{
public:
    Canvas();

    void fillRect(const Rect& rect, const Color& color, float radius = 0.f);
    void strokeRect(const Rect& rect, const Color& color, float width, float radius = 0.f);
    void text(const std::string& text, const Point& origin, const FontAttributes& font, const Color& color);

    void save();
    void restore();
    void transform(const Affine& transform);
    // intersects with the current clip, in local coordinates
    void clip(const Rect& rect);

    const Affine& currentTransform() const;
    const std::optional<Rect>& currentClip() const;

    const std::vector<Primitive>& primitives() const;
    void clear();

private:
    Primitive& add(Primitive::Type type, const Rect& rect, const Color& color);

private:
    struct Layer
    {
        Affine transform;
        std::optional<Rect> clip;
    };

    std::vector<Primitive> mPrimitives;
    std::vector<Layer> mLayers;
};

inline const Affine& Canvas::currentTransform() const
{
    return mLayers.back().transform;
}

inline const std::optional<Rect>& Canvas::currentClip() const
{
    return mLayers.back().clip;
}

inline const std::vector<Primitive>& Canvas::primitives() const
{
    return mPrimitives;
}

} // namespace tessel
