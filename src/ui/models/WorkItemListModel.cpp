#include "timebox/ui/models/WorkItemListModel.hpp"

#include <QMimeData>
#include <QSet>
#include <vector>

#include "timebox/data/WorkItemRepository.hpp"
#include "timebox/engine/PriorityScheduler.hpp"
#include "timebox/ui/mime/WorkItemMime.hpp"

namespace timebox {
namespace ui {

WorkItemListModel::WorkItemListModel(data::WorkItemRepository &repository, QObject *parent)
    : QAbstractListModel(parent)
    , m_repository(repository)
{
    refresh();
}

int WorkItemListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_items.size();
}

QVariant WorkItemListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_items.size()) {
        return {};
    }

    const auto &item = m_items.at(index.row());
    switch (role) {
    case Qt::DisplayRole: {
        QString display = item.name;
        if (item.estimatedHours > 0.0) {
            display += tr(" (%1h)").arg(item.estimatedHours);
        }
        if (item.status == data::WorkItemStatus::Completed) {
            display += tr(" - done");
        }
        return display;
    }
    case Qt::ToolTipRole:
        return item.description;
    case IdRole:
        return item.id;
    case PriorityRole:
        return item.priority;
    case HoursRole:
        return item.estimatedHours;
    case StatusRole:
        return static_cast<int>(item.status);
    case ColorRole:
        return engine::colorForWorkItem(item.id);
    default:
        return {};
    }
}

Qt::ItemFlags WorkItemListModel::flags(const QModelIndex &index) const
{
    auto defaultFlags = QAbstractListModel::flags(index);
    if (!index.isValid()) {
        return defaultFlags | Qt::ItemIsDropEnabled;
    }
    return defaultFlags | Qt::ItemIsDragEnabled | Qt::ItemIsSelectable | Qt::ItemIsEnabled;
}

Qt::DropActions WorkItemListModel::supportedDropActions() const
{
    return Qt::MoveAction;
}

QMimeData *WorkItemListModel::mimeData(const QModelIndexList &indexes) const
{
    auto *mime = new QMimeData();
    QList<WorkItemMimeEntry> entries;

    for (const auto &index : indexes) {
        if (!index.isValid()) {
            continue;
        }
        const auto &item = m_items.at(index.row());
        entries.append({ item.id, item.name, item.estimatedHours });
    }
    mime->setData(WorkItemMimeType, encodeWorkItemMime(entries));
    return mime;
}

QStringList WorkItemListModel::mimeTypes() const
{
    return { QString::fromLatin1(WorkItemMimeType) };
}

bool WorkItemListModel::dropMimeData(const QMimeData *data, Qt::DropAction action, int row, int column,
                                     const QModelIndex &parent)
{
    Q_UNUSED(column);
    if (action == Qt::IgnoreAction) {
        return true;
    }
    if (!data || action != Qt::MoveAction || !data->hasFormat(WorkItemMimeType)) {
        return false;
    }

    const auto entries = decodeWorkItemMime(data->data(WorkItemMimeType));
    if (entries.isEmpty()) {
        return false;
    }

    int target = row;
    if (target < 0) {
        target = parent.isValid() ? parent.row() : m_items.size();
    }

    QSet<QUuid> dragged;
    for (const auto &entry : entries) {
        dragged.insert(entry.id);
    }

    QVector<data::WorkItem> moved;
    QVector<data::WorkItem> remaining;
    int insertAt = target;
    for (int i = 0; i < m_items.size(); ++i) {
        const auto &item = m_items.at(i);
        if (dragged.contains(item.id)) {
            moved.append(item);
            if (i < target) {
                --insertAt;
            }
        } else {
            remaining.append(item);
        }
    }
    if (moved.isEmpty()) {
        return false;
    }

    insertAt = qBound(0, insertAt, remaining.size());
    QVector<data::WorkItem> ordered = remaining.mid(0, insertAt);
    ordered += moved;
    ordered += remaining.mid(insertAt);
    return applyOrder(ordered);
}

void WorkItemListModel::refresh()
{
    const auto items = m_repository.fetchWorkItems();
    beginResetModel();
    m_items.clear();
    m_items.reserve(static_cast<int>(items.size()));
    for (const auto &item : items) {
        m_items.append(item);
    }
    endResetModel();
}

bool WorkItemListModel::moveItem(int from, int to)
{
    if (from < 0 || from >= m_items.size() || to < 0 || to >= m_items.size()) {
        return false;
    }
    if (from == to) {
        return true;
    }
    QVector<data::WorkItem> ordered = m_items;
    ordered.move(from, to);
    return applyOrder(ordered);
}

const data::WorkItem *WorkItemListModel::workItemAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_items.size()) {
        return nullptr;
    }
    return &m_items.at(index.row());
}

bool WorkItemListModel::applyOrder(const QVector<data::WorkItem> &ordered)
{
    std::vector<QUuid> ids;
    ids.reserve(static_cast<size_t>(ordered.size()));
    for (const auto &item : ordered) {
        ids.push_back(item.id);
    }
    if (!m_repository.reorder(ids)) {
        return false;
    }
    refresh();
    emit priorityOrderChanged();
    return true;
}

} // namespace ui
} // namespace timebox
