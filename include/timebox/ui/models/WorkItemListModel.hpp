#pragma once

#include <QAbstractListModel>
#include <QVector>

#include "timebox/data/WorkItem.hpp"

namespace timebox {
namespace data {
class WorkItemRepository;
}

namespace ui {

// Work items in priority order. Moving a row, by drag and drop or moveItem(), renumbers priorities.
class WorkItemListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles
    {
        IdRole = Qt::UserRole + 1,
        PriorityRole,
        HoursRole,
        StatusRole,
        ColorRole,
    };

    explicit WorkItemListModel(data::WorkItemRepository &repository, QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;
    Qt::DropActions supportedDropActions() const override;
    QMimeData *mimeData(const QModelIndexList &indexes) const override;
    QStringList mimeTypes() const override;
    bool dropMimeData(const QMimeData *data, Qt::DropAction action, int row, int column,
                      const QModelIndex &parent) override;

    void refresh();
    bool moveItem(int from, int to);
    const data::WorkItem *workItemAt(const QModelIndex &index) const;

signals:
    void priorityOrderChanged();

private:
    bool applyOrder(const QVector<data::WorkItem> &ordered);

    data::WorkItemRepository &m_repository;
    QVector<data::WorkItem> m_items;
};

} // namespace ui
} // namespace timebox
