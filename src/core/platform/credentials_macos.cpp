#include "../credentials.hpp"
#include <Security/Security.h>
#include <CoreFoundation/CoreFoundation.h>
#include <fmt/format.h>

static CFStringRef cf_str(const std::string& s) {
    return CFStringCreateWithCString(kCFAllocatorDefault, s.c_str(), kCFStringEncodingUTF8);
}

static std::string cf_data_to_string(CFDataRef data) {
    return std::string(reinterpret_cast<const char*>(CFDataGetBytePtr(data)),
                       CFDataGetLength(data));
}

static std::string status_message(OSStatus status) {
    CFStringRef msg = SecCopyErrorMessageString(status, nullptr);
    if (!msg) return fmt::format("OSStatus {}", static_cast<int>(status));
    char buf[256];
    std::string out = CFStringGetCString(msg, buf, sizeof(buf), kCFStringEncodingUTF8)
        ? std::string(buf) : fmt::format("OSStatus {}", static_cast<int>(status));
    CFRelease(msg);
    return out;
}

Result<std::string> SystemCredentialStore::get(const std::string& service,
                                               const std::string& account) {
    CFStringRef cf_service = cf_str(service);
    CFStringRef cf_account = cf_str(account);

    CFMutableDictionaryRef query = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 4, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(query, kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(query, kSecAttrService, cf_service);
    CFDictionarySetValue(query, kSecAttrAccount, cf_account);
    CFDictionarySetValue(query, kSecReturnData, kCFBooleanTrue);

    CFTypeRef result = nullptr;
    OSStatus status = SecItemCopyMatching(query, &result);

    CFRelease(query);
    CFRelease(cf_service);
    CFRelease(cf_account);

    if (status == errSecItemNotFound) {
        return Result<std::string>::Err("no such item in Keychain");
    }
    if (status != errSecSuccess) {
        return Result<std::string>::Err("Keychain error: " + status_message(status));
    }

    std::string value = cf_data_to_string(static_cast<CFDataRef>(result));
    CFRelease(result);
    return Result<std::string>::Ok(value);
}

Result<void> SystemCredentialStore::set(const std::string& service, const std::string& account,
                                        const std::string& value) {
    CFStringRef cf_service = cf_str(service);
    CFStringRef cf_account = cf_str(account);
    CFDataRef cf_password = CFDataCreate(
        kCFAllocatorDefault,
        reinterpret_cast<const UInt8*>(value.data()),
        value.length());

    CFMutableDictionaryRef query = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 3, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(query, kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(query, kSecAttrService, cf_service);
    CFDictionarySetValue(query, kSecAttrAccount, cf_account);

    CFMutableDictionaryRef update = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 1, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(update, kSecValueData, cf_password);

    OSStatus status = SecItemUpdate(query, update);

    if (status == errSecItemNotFound) {
        CFDictionarySetValue(query, kSecValueData, cf_password);
        status = SecItemAdd(query, nullptr);
    }

    CFRelease(query);
    CFRelease(update);
    CFRelease(cf_password);
    CFRelease(cf_service);
    CFRelease(cf_account);

    if (status != errSecSuccess) {
        return Result<void>::Err("failed to store credential in Keychain: " + status_message(status));
    }
    return Result<void>::Ok();
}
