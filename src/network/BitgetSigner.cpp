#include "network/BitgetSigner.h"
#include <openssl/hmac.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace chainshuttle {
namespace network {

std::string BitgetSigner::base64Encode(const std::string& data) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data.c_str(), static_cast<int>(data.length()));
    BIO_flush(bio);

    BUF_MEM* buffer_ptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);

    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);
    return result;
}

std::string BitgetSigner::sign(
    const std::string& secret_key,
    const std::string& timestamp,
    const std::string& method,
    const std::string& request_path,
    const std::string& body
) {
    std::string upper_method = method;
    std::transform(upper_method.begin(), upper_method.end(), upper_method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    const std::string message = timestamp + upper_method + request_path + body;

    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;

    HMAC(EVP_sha256(),
         secret_key.c_str(), static_cast<int>(secret_key.length()),
         reinterpret_cast<const unsigned char*>(message.c_str()), message.length(),
         signature, &signature_len);

    return base64Encode(std::string(reinterpret_cast<char*>(signature), signature_len));
}

std::string BitgetSigner::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace chainshuttle
