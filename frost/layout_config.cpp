// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "layout_config.h"
#include <unordered_set>
#include <zen/file_access.h>
#include <zen/file_path.h>
#include <zen/extra_log.h>
#include <zen/i18n.h>
#include <zenxml/xml.h>
#include "table_error.h"

using namespace zen;
using namespace frost;


namespace zen
{
template <> inline
void writeText(const SortOrder& value, std::string& output)
{
    switch (value)
    {
        case SortOrder::ascending:
            output = "Ascending";
            break;
        case SortOrder::descending:
            output = "Descending";
            break;
    }
}

template <> inline
bool readText(const std::string& input, SortOrder& value)
{
    const std::string tmp = trimCpy(input);
    if (tmp == "Ascending")
        value = SortOrder::ascending;
    else if (tmp == "Descending")
        value = SortOrder::descending;
    else
        return false;
    return true;
}


template <> inline
void writeStruc(const ColumnState& value, XmlElement& output)
{
    output.setAttribute("Name",   value.name);
    output.setAttribute("Title",  value.title);
    output.setAttribute("Width",  value.width);
    output.setAttribute("Frozen", value.frozen);
}

template <> inline
bool readStruc(const XmlElement& input, ColumnState& value)
{
    bool success = true;
    success = input.getAttribute("Name",   value.name)   && success;
    success = input.getAttribute("Title",  value.title)  && success;
    success = input.getAttribute("Width",  value.width)  && success;
    success = input.getAttribute("Frozen", value.frozen) && success;
    return success; //[!] avoid short-circuit evaluation
}
}


PersistedLayout frost::captureLayout(const ColumnRegistry& columns, const SortState& sort)
{
    PersistedLayout layout;

    if (sort.column < columns.size())
        layout.sortColumnName = columns.getColumn(sort.column).name;
    layout.sortOrder = sort.order;

    for (PaneId pane : {PaneId::frozen, PaneId::normal})
        for (const std::wstring& name : columns.getDisplayNames(pane))
            layout.displayOrder.push_back(name);

    for (const Column& c : columns.getColumns())
        layout.columns.push_back({c.name, c.titleOverride, c.width, c.frozen});

    return layout;
}


void frost::restoreLayout(const PersistedLayout& layout, ColumnRegistry& columns, DataBridge& bridge) //throw ModelError
{
    ColumnUpdateScope updateScope(columns); //observers see the final state only

    const std::unordered_set<std::wstring> displayed(layout.displayOrder.begin(), layout.displayOrder.end());

    for (const ColumnState& cs : layout.columns)
        if (const int col = columns.findByName(cs.name);
            col >= 0) //column may have been removed since
        {
            columns.setTitleOverride(col, cs.title);
            columns.setWidth        (col, cs.width);
            columns.setFrozen       (col, cs.frozen);
            columns.setVisible      (col, displayed.contains(cs.name));
        }

    for (PaneId pane : {PaneId::frozen, PaneId::normal})
    {
        std::vector<std::wstring> names;
        for (const std::wstring& name : layout.displayOrder)
            if (const int col = columns.findByName(name);
                col >= 0 && columns.getPane(col) == pane)
                names.push_back(name);

        columns.setDisplayNames(pane, names); //visible columns not listed are appended
    }

    SortState sort = bridge.getSortState();

    if (const int col = columns.findByName(layout.sortColumnName);
        col >= 0)
        sort = {static_cast<size_t>(col), layout.sortOrder};

    if (const Sorter* sorter = bridge.getSorter();
        sorter && !columns.empty() && !sorter->isColumnSortable(sort.column))
        for (size_t i = 1; i < columns.size(); ++i)
        {
            const size_t col = (sort.column + i) % columns.size();
            if (sorter->isColumnSortable(col))
            {
                sort.column = col;
                break;
            }
        }

    bridge.sort(sort); //throw ModelError
}

//------------------------------------------------------------------------------------

namespace
{
XmlDoc toXmlDoc(const PersistedLayout& layout)
{
    XmlDoc doc("FrostGrid");
    doc.root().setAttribute("XmlType", "Layout");
    doc.root().setAttribute("XmlFormat", LAYOUT_XML_FORMAT_VER);

    XmlOut out(doc);
    out["Sort"].attribute("Column", layout.sortColumnName);
    out["Sort"].attribute("Order",  layout.sortOrder);
    out["DisplayOrder"](layout.displayOrder);
    out["Columns"     ](layout.columns);
    return doc;
}


bool isLayoutDoc(const XmlDoc& doc)
{
    std::string type;
    return doc.root().getName() == "FrostGrid" &&
           doc.root().getAttribute("XmlType", type) && type == "Layout";
}


std::pair<PersistedLayout, std::wstring /*warningMsg*/> fromXmlDoc(const XmlDoc& doc) //noexcept
{
    XmlIn in(doc);

    PersistedLayout layout;
    in["Sort"].attribute("Column", layout.sortColumnName);
    in["Sort"].attribute("Order",  layout.sortOrder);
    in["DisplayOrder"](layout.displayOrder);
    in["Columns"     ](layout.columns);

    std::wstring warningMsg;
    if (const std::wstring& errors = in.getErrors();
        !errors.empty())
        warningMsg = _("The table layout is incomplete. The missing elements have been set to their default values.") + L"\n\n" +
                     _("The following XML elements could not be read:") + L'\n' + errors;

    return {layout, warningMsg};
}
}


std::string frost::serializeLayout(const PersistedLayout& layout)
{
    return serializeXml(toXmlDoc(layout));
}


std::pair<PersistedLayout, std::wstring /*warningMsg*/> frost::parseLayout(const std::string& stream) //throw LayoutError
{
    XmlDoc doc;
    try
    {
        doc = parseXml(stream); //throw XmlParsingError
    }
    catch (const XmlParsingError& e)
    {
        throw LayoutError(_("Cannot read table layout."),
                          replaceCpy(replaceCpy(_("Error parsing XML data: row %y, column %x."),
                                                L"%y", numberTo<std::wstring>(e.row + 1)),
                                     L"%x", numberTo<std::wstring>(e.col + 1)));
    }

    if (!isLayoutDoc(doc))
        throw LayoutError(_("Cannot read table layout."), _("Data does not contain a valid table layout."));

    return fromXmlDoc(doc);
}


std::pair<PersistedLayout, std::wstring /*warningMsg*/> frost::readLayoutFile(const Zstring& filePath) //throw FileError
{
    const XmlDoc doc = loadXml(filePath); //throw FileError

    if (!isLayoutDoc(doc))
        throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)));

    return fromXmlDoc(doc);
}


void frost::writeLayoutFile(const PersistedLayout& layout, const Zstring& filePath) //throw FileError
{
    saveXml(toXmlDoc(layout), filePath); //throw FileError
}


Zstring XmlFolderLayoutStore::getFilePath(const std::string& key) const
{
    return appendPath(folderPath_, utfTo<Zstring>(key) + Zstr(".xml"));
}


std::optional<PersistedLayout> XmlFolderLayoutStore::readLayout(const std::string& key) //throw FileError
{
    const Zstring filePath = getFilePath(key);

    if (!itemExists(filePath)) //throw FileError
        return {};

    auto [layout, warningMsg] = readLayoutFile(filePath); //throw FileError
    if (!warningMsg.empty())
        logExtraError(fmtPath(filePath) + L"\n\n" + warningMsg);

    return layout;
}


void XmlFolderLayoutStore::writeLayout(const std::string& key, const PersistedLayout& layout) //throw FileError
{
    createDirectoryIfMissingRecursion(folderPath_); //throw FileError
    writeLayoutFile(layout, getFilePath(key)); //throw FileError
}
