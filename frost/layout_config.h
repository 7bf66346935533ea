// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef LAYOUT_CONFIG_H_9027743150462283198
#define LAYOUT_CONFIG_H_9027743150462283198

#include <optional>
#include <zen/zstring.h>
#include "data_bridge.h"


namespace frost
{
struct ColumnState
{
    std::wstring name;
    std::wstring title; //user override; empty: use the column's own title
    int width = 0;
    bool frozen = false;

    bool operator==(const ColumnState&) const = default;
};

//column identity is the name: indexes are not stable across sessions
struct PersistedLayout
{
    std::wstring sortColumnName;
    SortOrder sortOrder = SortOrder::ascending;
    std::vector<std::wstring> displayOrder; //visible columns only: frozen pane first, then normal pane
    std::vector<ColumnState> columns;

    bool operator==(const PersistedLayout&) const = default;
};

PersistedLayout captureLayout(const ColumnRegistry& columns, const SortState& sort);

//- persisted columns not in the registry are ignored
//- live columns missing from the persisted display order are appended
//- unsortable sort column => first sortable column
void restoreLayout(const PersistedLayout& layout, ColumnRegistry& columns, DataBridge& bridge); //throw ModelError

//------------------------------------------------------------------------------------

const int LAYOUT_XML_FORMAT_VER = 1;

std::string serializeLayout(const PersistedLayout& layout);
std::pair<PersistedLayout, std::wstring /*warningMsg*/> parseLayout(const std::string& stream); //throw LayoutError

std::pair<PersistedLayout, std::wstring /*warningMsg*/> readLayoutFile(const Zstring& filePath); //throw FileError
void writeLayoutFile(const PersistedLayout& layout, const Zstring& filePath); //throw FileError


//settings collaborator of persistent table views
class LayoutStore
{
public:
    virtual ~LayoutStore() {}

    virtual std::optional<PersistedLayout> readLayout(const std::string& key) = 0; //throw FileError; no value if nothing stored yet
    virtual void writeLayout(const std::string& key, const PersistedLayout& layout) = 0; //throw FileError
};


//one XML file per key inside a folder
class XmlFolderLayoutStore : public LayoutStore
{
public:
    explicit XmlFolderLayoutStore(const Zstring& folderPath) : folderPath_(folderPath) {}

    std::optional<PersistedLayout> readLayout(const std::string& key) override; //throw FileError
    void writeLayout(const std::string& key, const PersistedLayout& layout) override; //throw FileError

private:
    Zstring getFilePath(const std::string& key) const;

    const Zstring folderPath_;
};
}

#endif //LAYOUT_CONFIG_H_9027743150462283198
