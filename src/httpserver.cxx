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

#include "httpserver.hxx"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string.h>

#include <microhttpd.h>

#include "libupnpp/log.hxx"

#include "ctldispatch.hxx"

using namespace std;

#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MhdRet;
#else
typedef int MhdRet;
#endif

// Biggest POST body we accept. Control requests are small, the
// largest part is the DIDL metadata in SetAVTransportURI.
static const size_t maxBodySize = 1024 * 1024;

// Per-request data, kept in the connection context between calls
struct RequestCtx {
    string body;
    bool toobig{false};
};

class HttpServer::Internal {
public:
    Internal(const string& addr, int port, const ControlDispatcher& disp)
        : ipaddr(addr), listenport(port), dispatcher(disp) {
    }
    ~Internal() {
        stopMHD();
    }
    bool startMHD(string& reason);
    void stopMHD();

    MhdRet answerConn(
        struct MHD_Connection *connection, const char *url,
        const char *method, const char *upload_data,
        size_t *upload_data_size, void **con_cls);
    void requestCompleted(void **con_cls);

    string ipaddr;
    int listenport{-1};
    const ControlDispatcher& dispatcher;
    struct sockaddr_in listenaddr;
    struct MHD_Daemon *mhd{nullptr};
};

HttpServer::HttpServer(const string& ipaddr, int listenport,
                       const ControlDispatcher& dispatcher)
    : m(new Internal(ipaddr, listenport, dispatcher))
{
}

HttpServer::~HttpServer()
{
}

bool HttpServer::start(string& reason)
{
    return m->startMHD(reason);
}

void HttpServer::stop()
{
    m->stopMHD();
}

static MhdRet answer_to_connection(
    void *cls, struct MHD_Connection *conn,
    const char *url, const char *method, const char *,
    const char *upload_data, size_t *upload_data_size,
    void **con_cls)
{
    HttpServer::Internal *internal = static_cast<HttpServer::Internal*>(cls);
    if (internal) {
        return internal->answerConn(
            conn, url, method, upload_data, upload_data_size, con_cls);
    } else {
        return MHD_NO;
    }
}

static void request_completed_callback(
    void *cls, struct MHD_Connection *,
    void **con_cls, enum MHD_RequestTerminationCode)
{
    if (cls && *con_cls) {
        HttpServer::Internal *internal =
            static_cast<HttpServer::Internal*>(cls);
        internal->requestCompleted(con_cls);
    }
}

MhdRet HttpServer::Internal::answerConn(
    struct MHD_Connection *mhdconn, const char *url,
    const char *method, const char *upload_data, size_t *upload_data_size,
    void **con_cls)
{
    if (nullptr == *con_cls) {
        // First call, only headers are available.
        *con_cls = new RequestCtx;
        return MHD_YES;
    }
    RequestCtx *ctx = static_cast<RequestCtx*>(*con_cls);
    if (*upload_data_size != 0) {
        if (ctx->body.size() + *upload_data_size > maxBodySize) {
            ctx->toobig = true;
        } else {
            ctx->body.append(upload_data, *upload_data_size);
        }
        *upload_data_size = 0;
        return MHD_YES;
    }

    // Request complete
    ControlResponse resp;
    if (ctx->toobig) {
        LOGERR("HttpServer: " << method << " " << url << ": body too big\n");
        resp = ControlResponse(413);
    } else {
        resp = dispatcher.dispatch(method, url, ctx->body);
    }
    LOGDEB1("HttpServer: " << method << " " << url << " -> " << resp.status <<
            endl);

    struct MHD_Response *response = MHD_create_response_from_buffer(
        resp.body.size(), (void*)resp.body.c_str(), MHD_RESPMEM_MUST_COPY);
    if (nullptr == response) {
        LOGERR("HttpServer::answerConn: could not create response\n");
        return MHD_NO;
    }
    if (!resp.contentType.empty()) {
        MHD_add_response_header(response, "Content-Type",
                                resp.contentType.c_str());
    }
    MhdRet ret = MHD_queue_response(mhdconn, resp.status, response);
    MHD_destroy_response(response);
    return ret;
}

void HttpServer::Internal::requestCompleted(void **con_cls)
{
    RequestCtx *ctx = static_cast<RequestCtx*>(*con_cls);
    delete ctx;
    *con_cls = nullptr;
}

bool HttpServer::Internal::startMHD(string& reason)
{
    if (mhd) {
        return true;
    }
    // Null address: MHD listens on all interfaces
    struct sockaddr *bindaddr = nullptr;
    if (!ipaddr.empty()) {
        memset(&listenaddr, 0, sizeof(listenaddr));
        listenaddr.sin_family = AF_INET;
        listenaddr.sin_port = htons((unsigned short)listenport);
        if (inet_pton(AF_INET, ipaddr.c_str(), &listenaddr.sin_addr) != 1) {
            reason = string("bad listen address: ") + ipaddr;
            LOGERR("HttpServer: " << reason << endl);
            return false;
        }
        bindaddr = (struct sockaddr *)&listenaddr;
    }
    mhd = MHD_start_daemon(
        MHD_USE_SELECT_INTERNALLY,
        listenport,
        /* Accept policy callback and arg */
        nullptr, nullptr,
        /* handler and arg */
        &answer_to_connection, this,
        MHD_OPTION_NOTIFY_COMPLETED, request_completed_callback, this,
        MHD_OPTION_SOCK_ADDR, bindaddr,
        MHD_OPTION_END);

    if (nullptr == mhd) {
        reason = string("MHD_start_daemon failed for ") +
            (ipaddr.empty() ? string("*") : ipaddr) + ":" +
            to_string(listenport);
        LOGERR("HttpServer: " << reason << endl);
        return false;
    }
    LOGINF("HttpServer: listening on " <<
           (ipaddr.empty() ? string("*") : ipaddr) << ":" << listenport <<
           endl);
    return true;
}

void HttpServer::Internal::stopMHD()
{
    if (mhd) {
        MHD_stop_daemon(mhd);
        mhd = nullptr;
        LOGDEB("HttpServer: stopped\n");
    }
}
