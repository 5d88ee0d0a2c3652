#include "queuemanager.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

QueueManager::QueueManager(QObject *parent)
    : QAbstractListModel(parent)
{
}

QueueManager::~QueueManager() = default;

int QueueManager::add(const QString &url, QueueItem::Mode mode, const QVariantMap &options)
{
    QueueItem item;
    item.id = nextId_++;
    item.url = url;
    item.title = url;
    item.mode = mode;
    item.options = options;
    item.status = QueueItem::Status::Pending;
    item.progress = 0.0;

    const int index = items_.size();
    beginInsertRows(QModelIndex(), index, index);
    items_.append(item);
    endInsertRows();

    emit queueChanged();
    return index;
}

bool QueueManager::remove(int index)
{
    if (!isValidIndex(index)) {
        return false;
    }

    const QueueItem::Status status = items_[index].status;
    if (status != QueueItem::Status::Pending
        && status != QueueItem::Status::Finished
        && status != QueueItem::Status::Error) {
        return false;
    }

    beginRemoveRows(QModelIndex(), index, index);
    items_.removeAt(index);
    endRemoveRows();

    emit queueChanged();
    return true;
}

bool QueueManager::isTransitionAllowed(QueueItem::Status from, QueueItem::Status to)
{
    if (from == to) {
        return true;
    }

    switch (from) {
    case QueueItem::Status::Pending:
        return to == QueueItem::Status::Downloading || to == QueueItem::Status::Cancelled;
    case QueueItem::Status::Downloading:
        return to == QueueItem::Status::Finished
            || to == QueueItem::Status::Error
            || to == QueueItem::Status::Cancelled;
    case QueueItem::Status::Finished:
    case QueueItem::Status::Error:
    case QueueItem::Status::Cancelled:
        return false;
    }
    return false;
}

bool QueueManager::updateStatus(int index, QueueItem::Status status, const QString &errorMessage)
{
    if (!isValidIndex(index)) {
        return false;
    }

    QueueItem &item = items_[index];
    if (!isTransitionAllowed(item.status, status)) {
        qWarning() << "QueueManager: Rejected transition"
                   << queueStatusToString(item.status) << "->" << queueStatusToString(status)
                   << "for" << item.url;
        return false;
    }

    item.status = status;
    item.errorMessage = errorMessage;
    emitRowChanged(index);
    return true;
}

bool QueueManager::updateTitle(int index, const QString &title)
{
    if (!isValidIndex(index)) {
        return false;
    }

    items_[index].title = title;
    emitRowChanged(index);
    return true;
}

bool QueueManager::updateProgress(int index, double value)
{
    if (!isValidIndex(index)) {
        return false;
    }

    if (std::isnan(value)) {
        value = 0.0;
    }
    items_[index].progress = std::clamp(value, 0.0, 100.0);
    emitRowChanged(index);
    return true;
}

std::optional<QueueManager::PendingEntry> QueueManager::nextPending() const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].status == QueueItem::Status::Pending) {
            return PendingEntry{i, items_[i]};
        }
    }
    return std::nullopt;
}

int QueueManager::countPending() const
{
    return countWithStatus(QueueItem::Status::Pending);
}

int QueueManager::countWithStatus(QueueItem::Status status) const
{
    return static_cast<int>(std::count_if(items_.cbegin(), items_.cend(),
        [status](const QueueItem &item) { return item.status == status; }));
}

std::optional<QueueItem> QueueManager::item(int index) const
{
    if (!isValidIndex(index)) {
        return std::nullopt;
    }
    return items_[index];
}

int QueueManager::indexOfId(quint64 id) const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].id == id) {
            return i;
        }
    }
    return -1;
}

bool QueueManager::clearFinished()
{
    bool changed = false;

    // Remove back to front so row numbers stay valid for the model signals
    for (int i = items_.size() - 1; i >= 0; --i) {
        if (items_[i].isTerminal()) {
            beginRemoveRows(QModelIndex(), i, i);
            items_.removeAt(i);
            endRemoveRows();
            changed = true;
        }
    }

    if (changed) {
        emit queueChanged();
    }
    return changed;
}

bool QueueManager::clearAll()
{
    if (items_.isEmpty()) {
        return false;
    }

    beginResetModel();
    items_.clear();
    endResetModel();

    emit queueChanged();
    return true;
}

int QueueManager::cancelAllPending()
{
    int cancelled = 0;
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].status == QueueItem::Status::Pending) {
            items_[i].status = QueueItem::Status::Cancelled;
            items_[i].errorMessage = tr("Cancelled by user");
            emitRowChanged(i);
            ++cancelled;
        }
    }

    if (cancelled > 0) {
        emit queueChanged();
    }
    return cancelled;
}

int QueueManager::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return items_.size();
}

QVariant QueueManager::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || !isValidIndex(index.row())) {
        return QVariant();
    }

    const QueueItem &item = items_.at(index.row());

    switch (role) {
    case Qt::DisplayRole:
    case TitleRole:
        return item.title;
    case UrlRole:
        return item.url;
    case StatusRole:
        return static_cast<int>(item.status);
    case ModeRole:
        return static_cast<int>(item.mode);
    case OptionsRole:
        return item.options;
    case ErrorMessageRole:
        return item.errorMessage;
    case ProgressRole:
        return item.progress;
    case IdRole:
        return item.id;
    case Qt::ToolTipRole:
        if (!item.errorMessage.isEmpty()) {
            return QString("%1\n%2").arg(item.url, item.errorMessage);
        }
        return item.url;
    default:
        return QVariant();
    }
}

QHash<int, QByteArray> QueueManager::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[UrlRole] = "url";
    roles[StatusRole] = "status";
    roles[TitleRole] = "title";
    roles[ModeRole] = "mode";
    roles[OptionsRole] = "options";
    roles[ErrorMessageRole] = "errorMessage";
    roles[ProgressRole] = "progress";
    roles[IdRole] = "itemId";
    return roles;
}

void QueueManager::emitRowChanged(int index)
{
    const QModelIndex modelIndex = createIndex(index, 0);
    emit dataChanged(modelIndex, modelIndex);
}
