#include "core.h"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace hfl {

// ── Row JSON ──

QJsonObject Row::toJson() const {
    QJsonObject o;
    o["id"]       = id;
    o["parentId"] = parentId.isEmpty() ? QJsonValue() : QJsonValue(parentId);
    o["label"]    = label;
    if (value.isValid())     o["value"]     = QJsonValue::fromVariant(value);
    if (sparkline.isValid()) o["sparkline"] = QJsonValue::fromVariant(sparkline);
    if (tooltip.isValid())   o["tooltip"]   = QJsonValue::fromVariant(tooltip);
    if (!dropdownTag.isEmpty()) o["dropdown"] = dropdownTag;
    return o;
}

static QString scalarText(const QJsonValue& v) {
    if (v.isString()) return v.toString();
    if (v.isDouble()) return QString::number(v.toDouble(), 'g', 17);
    return {};
}

static QVariant scalarValue(const QJsonValue& v) {
    if (v.isDouble()) return v.toDouble();
    if (v.isString()) return v.toString();
    return {};
}

Row Row::fromJson(const QJsonObject& o) {
    Row r;
    r.id          = scalarText(o["id"]);
    r.parentId    = scalarText(o["parentId"]);
    r.label       = scalarText(o["label"]);
    r.value       = scalarValue(o["value"]);
    r.sparkline   = scalarValue(o["sparkline"]);
    r.tooltip     = scalarValue(o["tooltip"]);
    r.dropdownTag = scalarText(o["dropdown"]);
    r.identity    = r.id;
    return r;
}

// ── Normalisation ──

QVector<Row> normalizeRows(const QVector<Row>& raw) {
    QVector<Row> out;
    out.reserve(raw.size());
    for (const Row& in : raw) {
        Row r = in;
        r.id = r.id.trimmed();
        if (r.id.isEmpty()) continue;
        r.parentId = r.parentId.trimmed();
        r.label = r.label.trimmed();
        if (r.label.isEmpty()) r.label = r.id;
        if (!r.identity.isValid()) r.identity = r.id;
        out.append(r);
    }
    return out;
}

// ── Row files ──

RowFileResult parseRows(const QByteArray& json) {
    RowFileResult res;
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError) {
        res.error = QStringLiteral("JSON error at offset %1: %2")
                        .arg(perr.offset).arg(perr.errorString());
        return res;
    }

    QJsonArray arr;
    if (doc.isArray()) {
        arr = doc.array();
    } else if (doc.isObject() && doc.object()["rows"].isArray()) {
        arr = doc.object()["rows"].toArray();
        res.filtered = doc.object()["filtered"].toBool();
    } else {
        res.error = QStringLiteral("expected an array of rows or an object with \"rows\"");
        return res;
    }

    QVector<Row> raw;
    raw.reserve(arr.size());
    for (const QJsonValue& v : arr) {
        if (!v.isObject()) continue;
        raw.append(Row::fromJson(v.toObject()));
    }
    res.rows = normalizeRows(raw);
    res.ok = true;
    return res;
}

RowFileResult loadRowsFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        RowFileResult res;
        res.error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        qWarning() << "RowFile:" << res.error;
        return res;
    }
    RowFileResult res = parseRows(file.readAll());
    if (!res.ok) qWarning() << "RowFile:" << path << res.error;
    return res;
}

// ── Children index ──

ChildrenIndex buildChildrenIndex(const QVector<Row>& rows) {
    ChildrenIndex map;
    map.reserve(rows.size());
    for (const Row& r : rows) {
        if (!r.hasParent()) continue;
        map[r.parentId].append(r.id);
    }
    return map;
}

// ── RowStore ──

void RowStore::clear() {
    fullRows.clear();
    fullIndex.clear();
    rows.clear();
    index.clear();
}

bool RowStore::canReuseCache(const QVector<Row>& incoming, bool filterApplied) const {
    if (!filterApplied || fullRows.isEmpty()) return false;
    if (incoming.size() >= fullRows.size()) return false;

    QSet<QString> ids;
    ids.reserve(fullRows.size());
    for (const Row& r : fullRows) ids.insert(r.id);
    for (const Row& r : incoming) {
        if (!ids.contains(r.id)) return false;
    }
    return true;
}

namespace {

// Working set for a drill refresh: every cached row below the top-most
// ancestor of any incoming row, with the incoming scalar fields overlaid.
QVector<Row> expandDrill(const QVector<Row>& incoming, const QVector<Row>& full,
                         const ChildrenIndex& fullIndex) {
    if (incoming.isEmpty()) return {};

    QHash<QString, int> fullById;
    fullById.reserve(full.size());
    for (int i = 0; i < full.size(); i++) fullById.insert(full[i].id, i);

    QHash<QString, int> incomingById;
    incomingById.reserve(incoming.size());
    for (int i = 0; i < incoming.size(); i++) incomingById.insert(incoming[i].id, i);

    QSet<QString> rootIds;
    for (const Row& r : incoming) {
        QString cur = r.id;
        QSet<QString> seen;
        while (!seen.contains(cur)) {
            seen.insert(cur);
            int idx = fullById.value(cur, -1);
            if (idx < 0) break;
            const QString& pid = full[idx].parentId;
            if (pid.isEmpty() || !fullById.contains(pid)) break;
            cur = pid;
        }
        rootIds.insert(cur);
    }

    QSet<QString> include;
    QVector<QString> stack(rootIds.begin(), rootIds.end());
    while (!stack.isEmpty()) {
        QString id = stack.takeLast();
        if (include.contains(id)) continue;
        include.insert(id);
        for (const QString& c : fullIndex.value(id))
            stack.append(c);
    }

    QVector<Row> out;
    out.reserve(include.size());
    for (const Row& r : full) {
        if (!include.contains(r.id)) continue;
        Row merged = r;
        int ii = incomingById.value(r.id, -1);
        if (ii < 0) {
            merged.value     = QVariant();
            merged.sparkline = QVariant();
            merged.tooltip   = QVariant();
        } else {
            const Row& src = incoming[ii];
            merged.value     = src.value;
            merged.sparkline = src.sparkline;
            merged.tooltip   = src.tooltip;
            merged.identity  = src.identity;
        }
        out.append(merged);
    }
    return out;
}

} // anonymous namespace

IngestResult RowStore::ingest(const QVector<Row>& incoming, bool filterApplied) {
    IngestResult res;
    res.incoming = incoming.size();
    res.reusedCache = canReuseCache(incoming, filterApplied);

    if (!res.reusedCache) {
        fullRows  = incoming;
        fullIndex = buildChildrenIndex(fullRows);
        rows      = incoming;
    } else {
        rows = expandDrill(incoming, fullRows, fullIndex);
    }
    index = fullIndex;
    res.working = rows.size();

    qDebug() << "[Ingest]" << res.incoming << "rows in," << res.working << "working"
             << (res.reusedCache ? "(drill, cache reused)" : "");
    return res;
}

} // namespace hfl
