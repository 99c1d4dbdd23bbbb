#ifndef BOOKPAGED_HANDLERS_H
#define BOOKPAGED_HANDLERS_H

#include "BlobStore.h"

// each registers one drogon route group (see src/dh_*.cpp)
int registerRootHandler(void);
int registerUploadBookHandler(BlobStore& blobs);
int registerGetBookHandler(FileBlobStore& blobs);
int registerParseHandler(BlobStore& blobs);
int registerChaptersHandler(void);
int registerListHandler(void);
int registerProgressHandler(void);
int registerExtractCoversHandler(BlobStore& blobs);
int registerGetHandler(void);
int registerUpdateHandler(void);
int registerDeleteHandler(void);
int registerBlobHandler(FileBlobStore& blobs);

#endif // BOOKPAGED_HANDLERS_H
