#include "PolicyFilter.hpp"
#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/encoding_utf.hpp>

const char* contentTypeName(ContentType type) {
    return type == ContentType::Text ? "text" : "binary";
}

std::string PolicyFilter::extensionOf(const std::filesystem::path& path) {
    std::string ext = path.filename().extension().string();
    if (ext == ".") {
        return "";
    }
    return ext;
}

PolicyDecision PolicyFilter::check(const ResolvedPath& path, const std::filesystem::file_status& status,
                                   std::uintmax_t size, const PolicyConfig& config) {
    if (std::filesystem::is_directory(status)) {
        return PolicyDecision::accept();
    }
    if (size > config.maxFileSizeBytes) {
        return PolicyDecision::reject(ErrorKind::FileTooLarge,
            "File is too large: " + std::to_string(size) + " bytes exceeds the limit of " +
            std::to_string(config.maxFileSizeBytes) + " bytes");
    }
    std::string ext = extensionOf(path.path());
    if (!config.allowsExtension(ext)) {
        return PolicyDecision::reject(ErrorKind::ExtensionNotAllowed,
            ext.empty() ? std::string("Files without an extension are not allowed")
                        : "Extension '" + ext + "' is not allowed");
    }
    return PolicyDecision::accept();
}

void PolicyFilter::enforce(const ResolvedPath& path, const std::filesystem::file_status& status,
                           std::uintmax_t size, const PolicyConfig& config) {
    PolicyDecision decision = check(path, status, size, config);
    if (!decision.accepted) {
        throw AccessError(decision.reason, decision.message);
    }
}

ContentType PolicyFilter::classify(const char* data, std::size_t size) {
    if (size == 0) {
        return ContentType::Text;
    }
    try {
        boost::locale::conv::utf_to_utf<char>(data, data + size, boost::locale::conv::stop);
    } catch (const boost::locale::conv::conversion_error&) {
        return ContentType::Binary;
    }
    return ContentType::Text;
}
