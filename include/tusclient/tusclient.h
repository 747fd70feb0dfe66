/* 
 * File:   tusclient.h
 * Author: alex
 */

#ifndef TUSCLIENT_H
#define TUSCLIENT_H

#include "wilton/wilton.h"

#ifdef __cplusplus
extern "C" {
#endif

struct tusclient_Uploader;
typedef struct tusclient_Uploader tusclient_Uploader;

/*
 {
    // creation endpoint, tus 'POST' requests are sent here
    "url": "https://jamuploads.vrg.party/files",
    // bytes sent with a single 'PATCH' request
    "chunkSizeBytes": 1048576,
    // consecutive failures of a chunk after which the upload is abandoned
    "maxRetries": 3,
    // wait before retry N is 'N * backoffStepMillis'
    "backoffStepMillis": 1000,
    "multiThreaded": false,
    // additional 'Upload-Metadata' pairs, values are base64-encoded
    "metadata": {
        "key": "value",
        ...
    },
    "request": {
        "headers": {
            "Header-Name": "header_value",
            ...
        },
        // https://curl.haxx.se/libcurl/c/CURLOPT_TIMEOUT_MS.html
        "timeoutMillis": uint32_t,
        // https://curl.haxx.se/libcurl/c/CURLOPT_CONNECTTIMEOUT_MS.html
        "connecttimeoutMillis": uint32_t,
        // https://curl.haxx.se/libcurl/c/CURLOPT_TCP_KEEPALIVE.html
        "tcpKeepalive": false,
        // https://curl.haxx.se/libcurl/c/CURLOPT_USERAGENT.html
        "useragent": "",
        // https://curl.haxx.se/libcurl/c/CURLOPT_MAX_SEND_SPEED_LARGE.html
        "maxSentSpeedLargeBytesPerSecond": uint32_t,
        // https://curl.haxx.se/libcurl/c/CURLOPT_SSL_VERIFYHOST.html
        "sslVerifyhost": true,
        // https://curl.haxx.se/libcurl/c/CURLOPT_SSL_VERIFYPEER.html
        "sslVerifypeer": true,
        // https://curl.haxx.se/libcurl/c/CURLOPT_CAINFO.html
        "cainfoFilename": ""
    }
 }
 */
char* tusclient_Uploader_create(
        tusclient_Uploader** uploader_out,
        const char* conf_json,
        int conf_json_len);

char* tusclient_Uploader_close(
        tusclient_Uploader* uploader);

/*
 * Blocks until the upload is complete, failed or cancelled.
 * Exactly one of 'success_cb' and 'error_cb' is called before return,
 * returned error is non-null only for invalid arguments.
 */
char* tusclient_Uploader_upload(
        tusclient_Uploader* uploader,
        const char* file_data,
        int file_data_len,
        const char* filename,
        int filename_len,
        void* cb_ctx,
        void (*progress_cb)(
                void* cb_ctx,
                float progress),
        void (*success_cb)(
                void* cb_ctx,
                const char* session_url,
                int session_url_len),
        void (*error_cb)(
                void* cb_ctx,
                const char* message,
                int message_len));

/*
 * Can be called from any thread, running upload fails with "Upload cancelled"
 * at the next request or backoff wait. Subsequent uploads are cancelled immediately.
 */
char* tusclient_Uploader_cancel(
        tusclient_Uploader* uploader);

#ifdef __cplusplus
}
#endif

#endif /* TUSCLIENT_H */
