#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"
#include "observe/element_filters.hpp"

namespace tether {

struct PixelRect {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    bool hasArea() const
    {
        return x2 > x1 && y2 > y1;
    }
};

// Parse "[x1,y1][x2,y2]". Returns nullopt for anything else.
std::optional<PixelRect> parseBounds(const QString &bounds);
// The single interchange format for bounds, identical on every platform.
std::string formatBounds(const PixelRect &rect);

/**
 * Turns a raw accessibility dump into the filtered element list.
 *
 * The walk is pre-order and never prunes: a node that is filtered out is not
 * emitted, but its children are still visited. Malformed input yields an
 * empty list. References (@e1, @e2, ...) are assigned after filtering and are
 * only meaningful for the dump that produced them.
 */
class ElementNormalizer
{
public:
    virtual ~ElementNormalizer() = default;

    virtual std::vector<Element> normalize(const QString &rawTree,
                                           bool assignRefs = true) const = 0;
};

// Android uiautomator XML (<hierarchy><node .../></hierarchy>).
class UiAutomatorNormalizer : public ElementNormalizer
{
public:
    explicit UiAutomatorNormalizer(ElementFilters filters = ElementFilters::androidDefaults());

    std::vector<Element> normalize(const QString &rawTree,
                                   bool assignRefs = true) const override;

private:
    ElementFilters m_filters;
};

// iOS AXe describe-ui JSON: one root object or an array of roots, nested
// through "children".
class AxTreeNormalizer : public ElementNormalizer
{
public:
    explicit AxTreeNormalizer(ElementFilters filters = ElementFilters::iosDefaults());

    std::vector<Element> normalize(const QString &rawTree,
                                   bool assignRefs = true) const override;

private:
    ElementFilters m_filters;
};

// Compact one-line rendering used by `tether elements`.
std::string formatElementLine(const Element &element);

} // namespace tether
