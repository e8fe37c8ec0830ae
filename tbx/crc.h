// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef CRC_H_76123409856172349
#define CRC_H_76123409856172349

#include <cstdint>
#include <string_view>
#include <boost/crc.hpp>


namespace tbx
{
inline
uint16_t getCrc16(std::string_view bytes)
{
    boost::crc_16_type result;
    if (!bytes.empty())
        result.process_bytes(bytes.data(), bytes.size());

    const auto crc = result.checksum();
    static_assert(sizeof(crc) == sizeof(uint16_t));
    return crc;
}
}

#endif //CRC_H_76123409856172349
