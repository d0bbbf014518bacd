/* Copyright (C) 2024 J.F.Dockes
 *	 This program is free software; you can redistribute it and/or modify
 *	 it under the terms of the GNU General Public License as published by
 *	 the Free Software Foundation; either version 2 of the License, or
 *	 (at your option) any later version.
 *
 *	 This program is distributed in the hope that it will be useful,
 *	 but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	 GNU General Public License for more details.
 *
 *	 You should have received a copy of the GNU General Public License
 *	 along with this program; if not, write to the
 *	 Free Software Foundation, Inc.,
 *	 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _HTTPFS_H_X_INCLUDED_
#define _HTTPFS_H_X_INCLUDED_

#include <string>

// Descriptive values for the device description. Empty values are
// replaced by defaults.
struct UDevDesc {
    std::string fname;
    std::string uuid;
    std::string manufacturer;
    std::string manufacturerurl;
    std::string modelname;
    std::string modeldescription;
    std::string modelurl;
    std::string serialnumber;
};

// The documents served on GET requests.
struct DeviceDocs {
    // /DeviceSpec
    std::string description;
    // /AVTransport and /RenderingControl
    std::string avtscpd;
    std::string rcscpd;
};

/**
 * Build the device and service description documents. The device
 * description is generated from a template where the @XXX@ fields
 * are replaced by the (XML-escaped) values from desc. The service
 * descriptions list the actions and argument values the ActionCodec
 * accepts.
 */
extern DeviceDocs initHttpFs(const UDevDesc& desc);

#endif /* _HTTPFS_H_X_INCLUDED_ */
