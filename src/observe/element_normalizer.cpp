#include "observe/element_normalizer.hpp"

#include <QDomDocument>
#include <QDomElement>
#include <QRegularExpression>
#include <QStringList>

#include <cmath>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace tether {

namespace {

const QString kNameSeparator = QStringLiteral(" | ");
const QString kNodeTag = QStringLiteral("node");

QString refForIndex(int index)
{
    return QStringLiteral("@e%1").arg(index);
}

// Label composition shared by both platforms: the node's own text, then the
// text of every descendant reached without crossing an actionable boundary.
// Returns the composed name only when it joins more than one part and differs
// from the plain text.
QString composeName(const QString &ownText, const QStringList &descendantTexts)
{
    QStringList parts;
    if (!ownText.isEmpty()) {
        parts << ownText;
    }
    for (const QString &text : descendantTexts) {
        if (!text.isEmpty() && !parts.contains(text)) {
            parts << text;
        }
    }
    if (parts.size() < 2) {
        return QString();
    }
    const QString composed = parts.join(kNameSeparator);
    return composed == ownText ? QString() : composed;
}

void applyTextOrName(Element &element, const QString &text, const QString &composed)
{
    if (!composed.isEmpty()) {
        element.name = composed.toStdString();
    } else if (!text.isEmpty()) {
        element.text = text.toStdString();
    }
}

// --- uiautomator XML ------------------------------------------------------

bool isTrue(const QDomElement &node, const QString &attribute)
{
    return node.attribute(attribute) == QStringLiteral("true");
}

void collectXmlDescendantText(const QDomElement &node, QStringList &out)
{
    for (QDomElement child = node.firstChildElement(kNodeTag); !child.isNull();
         child = child.nextSiblingElement(kNodeTag)) {
        if (isTrue(child, QStringLiteral("clickable"))) {
            continue;
        }
        const QString text = child.attribute(QStringLiteral("text"));
        if (!text.isEmpty()) {
            out << text;
        }
        collectXmlDescendantText(child, out);
    }
}

class XmlWalker
{
public:
    XmlWalker(const ElementFilters &filters, bool assignRefs)
        : m_filters(filters)
        , m_assignRefs(assignRefs)
    {
    }

    void walk(const QDomElement &node)
    {
        if (node.tagName() == kNodeTag) {
            visit(node);
        }
        for (QDomElement child = node.firstChildElement(); !child.isNull();
             child = child.nextSiblingElement()) {
            walk(child);
        }
    }

    std::vector<Element> takeElements()
    {
        return std::move(m_elements);
    }

private:
    void visit(const QDomElement &node)
    {
        const QString cls = node.attribute(QStringLiteral("class"));
        const QString text = node.attribute(QStringLiteral("text"));
        const QString desc = node.attribute(QStringLiteral("content-desc"));
        const QString resourceId = node.attribute(QStringLiteral("resource-id"));
        const bool clickable = isTrue(node, QStringLiteral("clickable"));
        const bool scrollable = isTrue(node, QStringLiteral("scrollable"));

        const bool hasContent = !text.isEmpty() || !desc.isEmpty() || !resourceId.isEmpty();
        const bool interactive = clickable || scrollable;

        // Stage 1: layout containers that say and do nothing.
        if (m_filters.noiseTypes.contains(cls) && !hasContent && !interactive) {
            return;
        }

        // Stage 2: attribute filters.
        if (m_filters.reservedIds.contains(resourceId)) {
            return;
        }
        if (node.attribute(QStringLiteral("displayed")) == QStringLiteral("false")) {
            return;
        }
        const auto rect = parseBounds(node.attribute(QStringLiteral("bounds")));
        if (rect && !rect->hasArea()) {
            return;
        }
        if (!hasContent && !interactive) {
            return;
        }

        Element element;
        if (m_assignRefs) {
            element.ref = refForIndex(++m_refCounter).toStdString();
        }
        element.type = cls.section(QLatin1Char('.'), -1).toStdString();

        QStringList descendantTexts;
        collectXmlDescendantText(node, descendantTexts);
        applyTextOrName(element, text, composeName(text, descendantTexts));

        element.id = desc.toStdString();
        element.resourceId = resourceId.toStdString();
        element.clickable = clickable;
        element.enabled = node.attribute(QStringLiteral("enabled"), QStringLiteral("true"))
            != QStringLiteral("false");
        element.checked = isTrue(node, QStringLiteral("checked"));
        element.selected = isTrue(node, QStringLiteral("selected"));
        element.scrollable = scrollable;
        if (rect) {
            element.bounds = formatBounds(*rect);
        }

        m_elements.push_back(std::move(element));
    }

    const ElementFilters &m_filters;
    bool m_assignRefs;
    int m_refCounter = 0;
    std::vector<Element> m_elements;
};

// --- AXe JSON -------------------------------------------------------------

// AXe emits strings, but numbers show up for values such as sliders.
QString scalarField(const nlohmann::json &node, const char *key)
{
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return QString();
    }
    if (it->is_string()) {
        return QString::fromStdString(it->get<std::string>()).trimmed();
    }
    if (it->is_number() || it->is_boolean()) {
        return QString::fromStdString(it->dump());
    }
    return QString();
}

QString firstScalarField(const nlohmann::json &node, const char *key, const char *fallbackKey)
{
    const QString value = scalarField(node, key);
    return value.isEmpty() ? scalarField(node, fallbackKey) : value;
}

double frameNumber(const nlohmann::json &frame, const char *key)
{
    auto it = frame.find(key);
    if (it == frame.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

bool isAxInteractive(const nlohmann::json &node)
{
    const QString type = scalarField(node, "type");
    const QString role = firstScalarField(node, "role", "role_description");
    const bool button = type.contains(QStringLiteral("Button"))
        || role.contains(QStringLiteral("Button"));
    return button || type.contains(QStringLiteral("TextField"));
}

const nlohmann::json *childrenOf(const nlohmann::json &node)
{
    auto it = node.find("children");
    if (it == node.end() || !it->is_array()) {
        return nullptr;
    }
    return &*it;
}

void collectAxDescendantText(const nlohmann::json &node, QStringList &out)
{
    const nlohmann::json *children = childrenOf(node);
    if (!children) {
        return;
    }
    for (const auto &child : *children) {
        if (!child.is_object() || isAxInteractive(child)) {
            continue;
        }
        const QString label = scalarField(child, "AXLabel");
        if (!label.isEmpty()) {
            out << label;
        }
        collectAxDescendantText(child, out);
    }
}

class AxWalker
{
public:
    AxWalker(const ElementFilters &filters, bool assignRefs)
        : m_filters(filters)
        , m_assignRefs(assignRefs)
    {
    }

    void walk(const nlohmann::json &node)
    {
        if (!node.is_object()) {
            return;
        }
        visit(node);
        if (const nlohmann::json *children = childrenOf(node)) {
            for (const auto &child : *children) {
                walk(child);
            }
        }
    }

    std::vector<Element> takeElements()
    {
        return std::move(m_elements);
    }

private:
    void visit(const nlohmann::json &node)
    {
        const QString type = scalarField(node, "type");
        const QString label = scalarField(node, "AXLabel");
        const QString uniqueId = scalarField(node, "AXUniqueId");
        const QString value = firstScalarField(node, "value", "AXValue");
        const QString title = scalarField(node, "title");

        const bool hasContent = !label.isEmpty() || !uniqueId.isEmpty()
            || !title.isEmpty() || !value.isEmpty();
        const bool interactive = isAxInteractive(node);

        if (m_filters.noiseTypes.contains(type) && !hasContent && !interactive) {
            return;
        }
        if (!uniqueId.isEmpty() && m_filters.reservedIds.contains(uniqueId)) {
            return;
        }

        std::optional<PixelRect> rect;
        auto frameIt = node.find("frame");
        if (frameIt != node.end() && frameIt->is_object() && !frameIt->empty()) {
            // Origin + size in points; normalize to integer corners.
            const double x = frameNumber(*frameIt, "x");
            const double y = frameNumber(*frameIt, "y");
            const double width = frameNumber(*frameIt, "width");
            const double height = frameNumber(*frameIt, "height");
            PixelRect corners;
            corners.x1 = static_cast<int>(std::lround(x));
            corners.y1 = static_cast<int>(std::lround(y));
            corners.x2 = static_cast<int>(std::lround(x + width));
            corners.y2 = static_cast<int>(std::lround(y + height));
            if (!corners.hasArea()) {
                return;
            }
            rect = corners;
        }
        if (!hasContent && !interactive) {
            return;
        }

        Element element;
        if (m_assignRefs) {
            element.ref = refForIndex(++m_refCounter).toStdString();
        }
        element.type = (type.startsWith(QStringLiteral("AX")) ? type.mid(2) : type).toStdString();

        QStringList descendantTexts;
        collectAxDescendantText(node, descendantTexts);
        applyTextOrName(element, label, composeName(label, descendantTexts));

        if (!title.isEmpty() && title != label) {
            element.title = title.toStdString();
        }
        element.id = uniqueId.toStdString();
        element.value = value.toStdString();
        element.clickable = interactive;

        auto enabledIt = node.find("enabled");
        if (enabledIt != node.end() && enabledIt->is_boolean()) {
            element.enabled = enabledIt->get<bool>();
        }
        if (rect) {
            element.bounds = formatBounds(*rect);
        }

        m_elements.push_back(std::move(element));
    }

    const ElementFilters &m_filters;
    bool m_assignRefs;
    int m_refCounter = 0;
    std::vector<Element> m_elements;
};

} // namespace

std::optional<PixelRect> parseBounds(const QString &bounds)
{
    static const QRegularExpression pattern(
        QStringLiteral("^\\[(-?\\d+),(-?\\d+)\\]\\[(-?\\d+),(-?\\d+)\\]$"));
    const QRegularExpressionMatch match = pattern.match(bounds.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    PixelRect rect;
    rect.x1 = match.captured(1).toInt();
    rect.y1 = match.captured(2).toInt();
    rect.x2 = match.captured(3).toInt();
    rect.y2 = match.captured(4).toInt();
    return rect;
}

std::string formatBounds(const PixelRect &rect)
{
    std::ostringstream out;
    out << '[' << rect.x1 << ',' << rect.y1 << "][" << rect.x2 << ',' << rect.y2 << ']';
    return out.str();
}

UiAutomatorNormalizer::UiAutomatorNormalizer(ElementFilters filters)
    : m_filters(std::move(filters))
{
}

std::vector<Element> UiAutomatorNormalizer::normalize(const QString &rawTree,
                                                      bool assignRefs) const
{
    if (rawTree.trimmed().isEmpty()) {
        return {};
    }
    QDomDocument document;
    if (!document.setContent(rawTree)) {
        return {};
    }

    XmlWalker walker(m_filters, assignRefs);
    walker.walk(document.documentElement());
    return walker.takeElements();
}

AxTreeNormalizer::AxTreeNormalizer(ElementFilters filters)
    : m_filters(std::move(filters))
{
}

std::vector<Element> AxTreeNormalizer::normalize(const QString &rawTree,
                                                 bool assignRefs) const
{
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(rawTree.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        return {};
    }

    AxWalker walker(m_filters, assignRefs);
    if (data.is_array()) {
        for (const auto &root : data) {
            walker.walk(root);
        }
    } else {
        walker.walk(data);
    }
    return walker.takeElements();
}

std::string formatElementLine(const Element &element)
{
    std::vector<std::string> parts;
    if (!element.name.empty()) {
        parts.push_back("\"" + element.name + "\"");
    } else if (!element.text.empty()) {
        parts.push_back("\"" + element.text + "\"");
    }
    if (!element.id.empty()) {
        parts.push_back("id=\"" + element.id + "\"");
    }
    if (!element.resourceId.empty()) {
        parts.push_back("res=" + element.resourceId);
    }
    if (parts.empty()) {
        parts.push_back(element.type.empty() ? std::string("element") : element.type);
    }

    std::vector<std::string> flags;
    if (element.clickable) {
        flags.push_back("clickable");
    }
    if (!element.enabled) {
        flags.push_back("DISABLED");
    }
    if (element.checked) {
        flags.push_back("checked");
    }
    if (element.selected) {
        flags.push_back("selected");
    }
    if (element.scrollable) {
        flags.push_back("scrollable");
    }

    std::ostringstream out;
    if (!element.ref.empty()) {
        out << element.ref;
        for (std::size_t pad = element.ref.size(); pad < 5; ++pad) {
            out << ' ';
        }
        out << ' ';
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        out << parts[i];
    }
    if (!flags.empty()) {
        out << "  [";
        for (std::size_t i = 0; i < flags.size(); ++i) {
            if (i > 0) {
                out << ", ";
            }
            out << flags[i];
        }
        out << ']';
    }
    return out.str();
}

} // namespace tether
