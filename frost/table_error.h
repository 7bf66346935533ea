// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef TABLE_ERROR_H_4180372661950384715
#define TABLE_ERROR_H_4180372661950384715

#include <string>
#include <stdexcept>
#include <zen/string_tools.h>


namespace frost
{
class TableError //failure of a table operation, message is meant for end users
{
public:
    explicit TableError(const std::wstring& msg) : msg_(msg) {}
    TableError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~TableError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_TABLE_ERROR(X) struct X : public frost::TableError { X(const std::wstring& msg) : TableError(msg) {} X(const std::wstring& msg, const std::wstring& descr) : TableError(msg, descr) {} };

DEFINE_NEW_TABLE_ERROR(ModelError)  //a model capability reported failure
DEFINE_NEW_TABLE_ERROR(NativeError) //a pane refused a request
DEFINE_NEW_TABLE_ERROR(LayoutError) //persisted layout is unreadable


#define FROST_THROW_CONTRACT_VIOLATION() \
    throw std::logic_error("Contract violation! " + std::string(__FILE__) + ':' + zen::numberTo<std::string>(__LINE__))
}

#endif //TABLE_ERROR_H_4180372661950384715
