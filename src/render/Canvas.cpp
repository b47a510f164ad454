#include "Canvas.h"
#include <Logger.h>
#include <algorithm>

using namespace tessel;

Canvas::Canvas()
{
    mLayers.push_back(Layer { Affine::identity(), {} });
}

Primitive& Canvas::add(Primitive::Type type, const Rect& rect, const Color& color)
{
    Primitive primitive;
    primitive.type = type;
    primitive.rect = rect;
    primitive.transform = mLayers.back().transform;
    primitive.clip = mLayers.back().clip;
    primitive.color = premultiplied(color);
    mPrimitives.push_back(std::move(primitive));
    return mPrimitives.back();
}

void Canvas::fillRect(const Rect& rect, const Color& color, float radius)
{
    add(Primitive::Type::FillRect, rect, color).radius = radius;
}

void Canvas::strokeRect(const Rect& rect, const Color& color, float width, float radius)
{
    auto& primitive = add(Primitive::Type::StrokeRect, rect, color);
    primitive.strokeWidth = width;
    primitive.radius = radius;
}

void Canvas::text(const std::string& text, const Point& origin, const FontAttributes& font, const Color& color)
{
    auto& primitive = add(Primitive::Type::Text, Rect { origin.x, origin.y, 0.f, 0.f }, color);
    primitive.text = text;
    primitive.font = font;
}

void Canvas::save()
{
    mLayers.push_back(mLayers.back());
}

void Canvas::restore()
{
    if (mLayers.size() == 1) {
        spdlog::warn("Canvas::restore without matching save");
        return;
    }
    mLayers.pop_back();
}

void Canvas::transform(const Affine& transform)
{
    mLayers.back().transform *= transform;
}

void Canvas::clip(const Rect& rect)
{
    Layer& layer = mLayers.back();
    const Rect global = transformRect(layer.transform, rect);
    if (!layer.clip.has_value()) {
        layer.clip = global;
        return;
    }
    const Rect& current = *layer.clip;
    const float x1 = std::max(current.x, global.x);
    const float y1 = std::max(current.y, global.y);
    const float x2 = std::min(current.x + current.width, global.x + global.width);
    const float y2 = std::min(current.y + current.height, global.y + global.height);
    layer.clip = Rect { x1, y1, std::max(x2 - x1, 0.f), std::max(y2 - y1, 0.f) };
}

void Canvas::clear()
{
    mPrimitives.clear();
    mLayers.clear();
    mLayers.push_back(Layer { Affine::identity(), {} });
}
