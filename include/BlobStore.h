#ifndef BOOKPAGED_BLOBSTORE_H
#define BOOKPAGED_BLOBSTORE_H

#include <string>

//
// BlobStore: the object storage collaborator.  Keys are '/' separated
// ("books/<id>/<id>.epub").  The engine only ever gets, puts and asks for a
// public URL.
//
class BlobStore {
public:
    virtual ~BlobStore() = default;

    // RETURNS: false if there is no blob under this key
    virtual bool get(const std::string& key, std::string& bytesOut) = 0;

    // throws std::runtime_error if the blob can't be stored
    virtual void put(const std::string& key, const std::string& bytes, const std::string& contentType) = 0;

    // URL a reading client can fetch the blob from
    virtual std::string urlFor(const std::string& key) const = 0;
};

//
// FileBlobStore: blobs as plain files under a root directory, served back
// by the /blob/ handler (content type comes from the key's extension).
//
class FileBlobStore : public BlobStore {
public:
    FileBlobStore(std::string root, std::string baseUrl);

    bool get(const std::string& key, std::string& bytesOut) override;
    void put(const std::string& key, const std::string& bytes, const std::string& contentType) override;
    std::string urlFor(const std::string& key) const override;

    // RETURNS: the file path for key, or empty if the key escapes the root
    std::string pathFor(const std::string& key) const;

private:
    std::string root_;
    std::string baseUrl_;
};

#endif // BOOKPAGED_BLOBSTORE_H
