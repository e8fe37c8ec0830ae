// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef GUID_H_23098745610923847
#define GUID_H_23098745610923847

    #include <unistd.h> //getentropy
    #include "sys_error.h"


namespace tbx
{
inline
std::string generateGUID() //creates a 16-byte GUID
{
    std::string guid(16, '\0');

    //getentropy() requires Glibc 2.25; "maximum permitted value for the length argument is 256"
    if (::getentropy(guid.data(), guid.size()) != 0)
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Failed to generate GUID." + "\n\n" +
                                 utfTo<std::string>(formatSystemError("getentropy", errno)));
    return guid;
}
}

#endif //GUID_H_23098745610923847
