#ifndef QUEUEMANAGER_H
#define QUEUEMANAGER_H

#include <QAbstractListModel>
#include <QList>
#include <QString>
#include <QVariantMap>
#include <optional>

#include "queueitem.h"

/**
 * @brief Ordered list of download jobs and their lifecycle state.
 *
 * QueueManager only holds state and applies transitions; it never starts
 * work itself. QueueController pulls pending items from it and routes task
 * outcomes back into it.
 *
 * Items are addressed by their positional index, which is validated before
 * every mutation. Each item also carries a stable id so that a consumer can
 * re-resolve its index after the list was modified underneath it.
 *
 * Allowed status transitions:
 * - Pending -> Downloading, Pending -> Cancelled
 * - Downloading -> Finished, Error or Cancelled
 */
class QueueManager : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        UrlRole = Qt::UserRole + 1,
        StatusRole,
        TitleRole,
        ModeRole,
        OptionsRole,
        ErrorMessageRole,
        ProgressRole,
        IdRole
    };

    struct PendingEntry {
        int index = -1;
        QueueItem item;
    };

    explicit QueueManager(QObject *parent = nullptr);
    ~QueueManager() override;

    /**
     * @brief Appends a new Pending item.
     * @return Index of the new item.
     */
    int add(const QString &url, QueueItem::Mode mode, const QVariantMap &options = QVariantMap());

    /**
     * @brief Removes an item that is Pending, Finished or Error.
     * @return False for out-of-range indexes and for Downloading or Cancelled items.
     */
    bool remove(int index);

    bool updateStatus(int index, QueueItem::Status status, const QString &errorMessage = QString());
    bool updateTitle(int index, const QString &title);

    /// Stores @p value clamped to [0, 100]
    bool updateProgress(int index, double value);

    /// First Pending item in insertion order
    [[nodiscard]] std::optional<PendingEntry> nextPending() const;

    [[nodiscard]] int countPending() const;
    [[nodiscard]] int countWithStatus(QueueItem::Status status) const;
    [[nodiscard]] bool isEmpty() const { return items_.isEmpty(); }
    [[nodiscard]] int size() const { return items_.size(); }
    [[nodiscard]] const QList<QueueItem> &items() const { return items_; }
    [[nodiscard]] std::optional<QueueItem> item(int index) const;

    /// Current index of the item with @p id, or -1 if it is gone
    [[nodiscard]] int indexOfId(quint64 id) const;

    /**
     * @brief Removes every Finished, Error and Cancelled item.
     * @return True if anything was removed.
     */
    bool clearFinished();

    /**
     * @brief Removes all items regardless of state.
     * @return True if the queue was non-empty.
     */
    bool clearAll();

    /**
     * @brief Marks every Pending item Cancelled in one pass.
     * @return Number of items cancelled.
     */
    int cancelAllPending();

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    [[nodiscard]] static bool isTransitionAllowed(QueueItem::Status from, QueueItem::Status to);

signals:
    /// Emitted whenever the composition of the queue changes
    void queueChanged();

private:
    [[nodiscard]] bool isValidIndex(int index) const { return index >= 0 && index < items_.size(); }
    void emitRowChanged(int index);

    QList<QueueItem> items_;
    quint64 nextId_ = 1;
};

#endif // QUEUEMANAGER_H
