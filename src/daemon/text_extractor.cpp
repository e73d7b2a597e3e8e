#include "daemon/text_extractor.hpp"

#include <QString>

#include <lexbor/dom/interfaces/character_data.h>
#include <lexbor/dom/interfaces/node.h>
#include <lexbor/html/interfaces/document.h>
#include <lexbor/html/parser.h>
#include <lexbor/tag/const.h>

#include "common/logging.hpp"

namespace pagewatch {

namespace {

bool isHiddenContainer(lxb_dom_node_t *node)
{
    if (node->type != LXB_DOM_NODE_TYPE_ELEMENT) {
        return false;
    }
    switch (lxb_dom_node_tag_id(node)) {
    case LXB_TAG_SCRIPT:
    case LXB_TAG_STYLE:
    case LXB_TAG_TEMPLATE:
        return true;
    default:
        return false;
    }
}

void appendTextNode(lxb_dom_node_t *node, std::string &out)
{
    const auto *data = lxb_dom_interface_character_data(node);
    if (data->data.data == nullptr || data->data.length == 0) {
        return;
    }

    const QString trimmed = QString::fromUtf8(
        reinterpret_cast<const char *>(data->data.data),
        static_cast<qsizetype>(data->data.length)).trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    if (!out.empty()) {
        out.push_back('\n');
    }
    out += trimmed.toStdString();
}

// Next node in document order, skipping the subtree below node when
// descend is false.
lxb_dom_node_t *nextNode(lxb_dom_node_t *node, lxb_dom_node_t *root, bool descend)
{
    if (descend && node->first_child != nullptr) {
        return node->first_child;
    }
    while (node != nullptr && node != root) {
        if (node->next != nullptr) {
            return node->next;
        }
        node = node->parent;
    }
    return nullptr;
}

} // namespace

std::string extractVisibleText(const std::string &html)
{
    lxb_html_document_t *document = lxb_html_document_create();
    if (document == nullptr) {
        PWLOG_ERROR(QStringLiteral("TextExtractor"),
                    QStringLiteral("extractVisibleText"),
                    QStringLiteral("document_create_failed"),
                    QStringLiteral("allocation"),
                    QStringLiteral("lexbor"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"bytes", html.size()}}));
        return {};
    }

    const lxb_status_t status = lxb_html_document_parse(
        document, reinterpret_cast<const lxb_char_t *>(html.data()), html.size());
    if (status != LXB_STATUS_OK) {
        PWLOG_WARN(QStringLiteral("TextExtractor"),
                   QStringLiteral("extractVisibleText"),
                   QStringLiteral("parse_failed"),
                   QStringLiteral("lexbor_status"),
                   QStringLiteral("empty_text"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"status", static_cast<int>(status)},
                                   {"bytes", html.size()}}));
        lxb_html_document_destroy(document);
        return {};
    }

    std::string text;
    lxb_dom_node_t *root = lxb_dom_interface_node(document);
    lxb_dom_node_t *node = root->first_child;
    while (node != nullptr) {
        const bool hidden = isHiddenContainer(node);
        if (node->type == LXB_DOM_NODE_TYPE_TEXT) {
            appendTextNode(node, text);
        }
        node = nextNode(node, root, !hidden);
    }

    lxb_html_document_destroy(document);
    return text;
}

} // namespace pagewatch
