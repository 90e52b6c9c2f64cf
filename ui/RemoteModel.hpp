// Read-only table view over the current remote DirectoryListing.
#pragma once
#include <QAbstractTableModel>
#include <vector>
#include "datadrift/DirectoryCache.hpp"

class RemoteModel : public QAbstractTableModel {
    Q_OBJECT
public:
    explicit RemoteModel(QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override { Q_UNUSED(parent); return 4; }
    QVariant data(const QModelIndex& index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;
    void sort(int column, Qt::SortOrder order) override;

    // Replace rows with a fresh listing.
    void setListing(const datadrift::DirectoryListing& listing);
    void clear();
    QString rootPath() const { return QString::fromStdString(listing_.path); }
    std::uint64_t version() const { return listing_.version; }

    bool isDir(const QModelIndex& idx) const;
    QString nameAt(const QModelIndex& idx) const;
    // Absolute remote path of the row.
    QString pathAt(const QModelIndex& idx) const;
    void setShowHidden(bool v);
    bool showHidden() const { return showHidden_; }

private:
    void rebuild();

    datadrift::DirectoryListing listing_;
    std::vector<datadrift::RemoteEntry> items_;
    bool showHidden_ = false; // hide names starting with '.' if false
    int sortColumn_ = 0;
    Qt::SortOrder sortOrder_ = Qt::AscendingOrder;
};
