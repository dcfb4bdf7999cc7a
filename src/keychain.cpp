#include "symcli/keychain.hpp"

#include <memory>
#include <string>

#include "symcli/options.hpp"

#if defined(__APPLE__)
#include <Security/Security.h>
#elif defined(SYMCLI_HAVE_LIBSECRET) && SYMCLI_HAVE_LIBSECRET
#include <libsecret/secret.h>
#endif

namespace symcli {

namespace {

#if defined(__APPLE__)

class MacKeychain final : public IKeychain {
public:
    SymStatus Read(const std::string& label, std::string& out_key) override {
        const std::string service(kKeychainService);
        void* data = nullptr;
        UInt32 length = 0;
        SecKeychainItemRef item = nullptr;
        const OSStatus status = SecKeychainFindGenericPassword(
            nullptr, static_cast<UInt32>(service.size()), service.data(),
            static_cast<UInt32>(label.size()), label.data(), &length, &data, &item);
        if (status != errSecSuccess) {
            if (item != nullptr) {
                CFRelease(item);
            }
            return SymStatus::KeychainMiss;
        }
        out_key.assign(static_cast<const char*>(data), static_cast<const char*>(data) + length);
        SecKeychainItemFreeContent(nullptr, data);
        if (item != nullptr) {
            CFRelease(item);
        }
        return SymStatus::Ok;
    }

    SymStatus Write(const std::string& label, const std::string& key) override {
        const std::string service(kKeychainService);
        SecKeychainItemRef item = nullptr;
        OSStatus status = SecKeychainFindGenericPassword(
            nullptr, static_cast<UInt32>(service.size()), service.data(),
            static_cast<UInt32>(label.size()), label.data(), nullptr, nullptr, &item);
        if (status == errSecSuccess && item != nullptr) {
            status = SecKeychainItemModifyAttributesAndData(
                item, nullptr, static_cast<UInt32>(key.size()), key.data());
            CFRelease(item);
            return status == errSecSuccess ? SymStatus::Ok : SymStatus::KeychainWriteFailed;
        }
        if (item != nullptr) {
            CFRelease(item);
        }
        status = SecKeychainAddGenericPassword(
            nullptr, static_cast<UInt32>(service.size()), service.data(),
            static_cast<UInt32>(label.size()), label.data(),
            static_cast<UInt32>(key.size()), key.data(), nullptr);
        return status == errSecSuccess ? SymStatus::Ok : SymStatus::KeychainWriteFailed;
    }
};

#elif defined(SYMCLI_HAVE_LIBSECRET) && SYMCLI_HAVE_LIBSECRET

const SecretSchema* KeySchema() {
    static const SecretSchema schema = {
        "io.sym.PrivateKey", SECRET_SCHEMA_NONE,
        {{"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
         {"label", SECRET_SCHEMA_ATTRIBUTE_STRING},
         {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING}}};
    return &schema;
}

class SecretServiceKeychain final : public IKeychain {
public:
    SymStatus Read(const std::string& label, std::string& out_key) override {
        GError* error = nullptr;
        gchar* secret = secret_password_lookup_sync(
            KeySchema(), nullptr, &error,
            "service", kKeychainService, "label", label.c_str(), nullptr);
        if (error != nullptr) {
            g_error_free(error);
            return SymStatus::KeychainMiss;
        }
        if (secret == nullptr) {
            return SymStatus::KeychainMiss;
        }
        out_key.assign(secret);
        secret_password_free(secret);
        return SymStatus::Ok;
    }

    SymStatus Write(const std::string& label, const std::string& key) override {
        GError* error = nullptr;
        const std::string display = std::string(kKeychainService) + ": " + label;
        secret_password_store_sync(
            KeySchema(), SECRET_COLLECTION_DEFAULT, display.c_str(), key.c_str(), nullptr, &error,
            "service", kKeychainService, "label", label.c_str(), nullptr);
        if (error != nullptr) {
            g_error_free(error);
            return SymStatus::KeychainWriteFailed;
        }
        return SymStatus::Ok;
    }
};

#endif

}  // namespace

bool KeychainSupported() {
#if defined(__APPLE__)
    return true;
#elif defined(SYMCLI_HAVE_LIBSECRET) && SYMCLI_HAVE_LIBSECRET
    return true;
#else
    return false;
#endif
}

std::unique_ptr<IKeychain> CreateSystemKeychain() {
#if defined(__APPLE__)
    return std::make_unique<MacKeychain>();
#elif defined(SYMCLI_HAVE_LIBSECRET) && SYMCLI_HAVE_LIBSECRET
    return std::make_unique<SecretServiceKeychain>();
#else
    return nullptr;
#endif
}

Capabilities Capabilities::Detect() {
    Capabilities capabilities;
    capabilities.keychain = KeychainSupported();
    return capabilities;
}

}  // namespace symcli
