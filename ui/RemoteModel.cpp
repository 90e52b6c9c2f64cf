// Remote model implementation (table: Name, Size, Date, Permissions).
#include "RemoteModel.hpp"
#include "datadrift/RemotePath.hpp"
#include <QDateTime>
#include <QLocale>
#include <QVariant>
#include <algorithm>

using datadrift::EntryKind;
using datadrift::RemoteEntry;

RemoteModel::RemoteModel(QObject* parent) : QAbstractTableModel(parent) {}

int RemoteModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return static_cast<int>(items_.size());
}

QVariant RemoteModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() < 0 || index.row() >= (int)items_.size())
        return {};
    const auto& it = items_[index.row()];
    const bool dir = it.kind == EntryKind::Directory;
    if (role == Qt::DisplayRole) {
        switch (index.column()) {
            case 0: {
                const QString name = QString::fromStdString(it.name);
                if (it.kind == EntryKind::Symlink) return name + "@";
                return dir ? name + "/" : name;
            }
            case 1:
                if (dir) return QVariant();
                return QLocale().formattedDataSize((qint64)it.size, 1, QLocale::DataSizeIecFormat);
            case 2:
                if (it.mtime > 0)
                    return QLocale().toString(QDateTime::fromSecsSinceEpoch((qint64)it.mtime), QLocale::ShortFormat);
                return QVariant();
            case 3: {
                // Permissions in rwxr-xr-x style
                QString s(10, '-');
                const quint32 m = it.mode;
                s[0] = it.kind == EntryKind::Symlink ? 'l' : (dir ? 'd' : '-');
                auto bit = [&](int pos, quint32 mask, QChar ch) { if (m & mask) s[pos] = ch; };
                bit(1, 0400, 'r'); bit(2, 0200, 'w'); bit(3, 0100, 'x');
                bit(4, 0040, 'r'); bit(5, 0020, 'w'); bit(6, 0010, 'x');
                bit(7, 0004, 'r'); bit(8, 0002, 'w'); bit(9, 0001, 'x');
                return s;
            }
        }
    }
    if (role == Qt::ToolTipRole) {
        if (dir) return tr("Folder");
        QString tip = tr("File");
        if (it.size > 0) {
            const QString human = QLocale().formattedDataSize((qint64)it.size, 1, QLocale::DataSizeIecFormat);
            const QString bytes = QLocale().toString((qulonglong)it.size);
            tip += QString(" • %1 (%2 bytes)").arg(human, bytes);
        }
        if (it.mtime > 0)
            tip += " • " + QLocale().toString(QDateTime::fromSecsSinceEpoch((qint64)it.mtime), QLocale::ShortFormat);
        return tip;
    }
    return {};
}

Qt::ItemFlags RemoteModel::flags(const QModelIndex& index) const {
    if (!index.isValid()) return Qt::NoItemFlags;
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

void RemoteModel::setListing(const datadrift::DirectoryListing& listing) {
    listing_ = listing;
    rebuild();
}

void RemoteModel::clear() {
    listing_ = datadrift::DirectoryListing();
    rebuild();
}

void RemoteModel::setShowHidden(bool v) {
    if (showHidden_ == v) return;
    showHidden_ = v;
    rebuild();
}

void RemoteModel::rebuild() {
    beginResetModel();
    items_.clear();
    items_.reserve(listing_.entries.size());
    for (const auto& e : listing_.entries) {
        if (!showHidden_ && !e.name.empty() && e.name[0] == '.') continue;
        items_.push_back(e);
    }
    endResetModel();
    sort(sortColumn_, sortOrder_);
}

bool RemoteModel::isDir(const QModelIndex& idx) const {
    if (!idx.isValid() || idx.row() >= (int)items_.size()) return false;
    return items_[idx.row()].kind == EntryKind::Directory;
}

QString RemoteModel::nameAt(const QModelIndex& idx) const {
    if (!idx.isValid() || idx.row() >= (int)items_.size()) return {};
    return QString::fromStdString(items_[idx.row()].name);
}

QString RemoteModel::pathAt(const QModelIndex& idx) const {
    if (!idx.isValid() || idx.row() >= (int)items_.size()) return {};
    return QString::fromStdString(datadrift::remotepath::join(listing_.path, items_[idx.row()].name));
}

QVariant RemoteModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole) return {};
    switch (section) {
        case 0: return tr("Name");
        case 1: return tr("Size");
        case 2: return tr("Date");
        case 3: return tr("Permissions");
    }
    return {};
}

void RemoteModel::sort(int column, Qt::SortOrder order) {
    sortColumn_ = column;
    sortOrder_ = order;
    if (items_.empty()) return;
    beginResetModel();
    const bool asc = (order == Qt::AscendingOrder);
    auto lessStr = [&](const std::string& a, const std::string& b) {
        int cmp = QString::compare(QString::fromStdString(a), QString::fromStdString(b), Qt::CaseInsensitive);
        return asc ? (cmp < 0) : (cmp > 0);
    };
    auto less = [&](const RemoteEntry& a, const RemoteEntry& b) {
        // Directories first, then criterion
        const bool ad = a.kind == EntryKind::Directory;
        const bool bd = b.kind == EntryKind::Directory;
        if (ad != bd) return ad;
        switch (column) {
            case 0: return lessStr(a.name, b.name);
            case 1: return asc ? (a.size < b.size) : (a.size > b.size);
            case 2: return asc ? (a.mtime < b.mtime) : (a.mtime > b.mtime);
            case 3: return asc ? (a.mode < b.mode) : (a.mode > b.mode);
        }
        return lessStr(a.name, b.name);
    };
    std::stable_sort(items_.begin(), items_.end(), less);
    endResetModel();
}
