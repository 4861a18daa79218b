/*
 * wmi.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Windows Management Instrumentation queries

**************************************************/

#include "wmi.hpp"

#include <optional>

#ifdef _WIN32
// clang-format off
#include <windows.h>
#include <comdef.h>
#include <Wbemidl.h>
// clang-format on
#if !defined(__MINGW32__) && !defined(__MINGW64__)
#pragma comment(lib, "wbemuuid.lib")
#pragma comment(lib, "ole32.lib")
#pragma comment(lib, "oleaut32.lib")
#endif

#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"
#include "airmon/utils/string.hpp"
#endif

namespace airmon::system {

#ifdef _WIN32
namespace {

auto bstrToString(BSTR bstr) -> std::string {
    if (bstr == nullptr) {
        return {};
    }
    return utils::wstringToString(std::wstring_view(bstr, SysStringLen(bstr)));
}

template <typename T>
struct ComRelease {
    void operator()(T* ptr) const {
        if (ptr != nullptr) {
            ptr->Release();
        }
    }
};

template <typename T>
using ComPtr = std::unique_ptr<T, ComRelease<T>>;

/**
 * @brief COM apartment plus an authenticated ROOT\CIMV2 connection.
 */
class WmiSession {
public:
    WmiSession() {
        HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
        if (FAILED(hr) && hr != RPC_E_CHANGED_MODE) {
            THROW_SYSTEM_ERROR("CoInitializeEx failed: 0x", std::hex, hr);
        }
        initialized_ = SUCCEEDED(hr);

        hr = CoInitializeSecurity(nullptr, -1, nullptr, nullptr,
                                  RPC_C_AUTHN_LEVEL_DEFAULT,
                                  RPC_C_IMP_LEVEL_IMPERSONATE, nullptr,
                                  EOAC_NONE, nullptr);
        if (FAILED(hr) && hr != RPC_E_TOO_LATE) {
            uninitialize();
            THROW_SYSTEM_ERROR("CoInitializeSecurity failed: 0x", std::hex,
                               hr);
        }

        IWbemLocator* locator = nullptr;
        hr = CoCreateInstance(CLSID_WbemLocator, nullptr, CLSCTX_INPROC_SERVER,
                              IID_IWbemLocator,
                              reinterpret_cast<LPVOID*>(&locator));
        if (FAILED(hr)) {
            uninitialize();
            THROW_SYSTEM_ERROR("Failed to create IWbemLocator: 0x", std::hex,
                               hr);
        }
        locator_.reset(locator);

        IWbemServices* services = nullptr;
        hr = locator_->ConnectServer(_bstr_t(L"ROOT\\CIMV2"), nullptr, nullptr,
                                     nullptr, 0, nullptr, nullptr, &services);
        if (FAILED(hr)) {
            locator_.reset();
            uninitialize();
            THROW_SYSTEM_ERROR("Could not connect to ROOT\\CIMV2: 0x",
                               std::hex, hr);
        }
        services_.reset(services);

        hr = CoSetProxyBlanket(services_.get(), RPC_C_AUTHN_WINNT,
                               RPC_C_AUTHZ_NONE, nullptr,
                               RPC_C_AUTHN_LEVEL_CALL,
                               RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE);
        if (FAILED(hr)) {
            services_.reset();
            locator_.reset();
            uninitialize();
            THROW_SYSTEM_ERROR("CoSetProxyBlanket failed: 0x", std::hex, hr);
        }
    }

    ~WmiSession() {
        services_.reset();
        locator_.reset();
        uninitialize();
    }

    WmiSession(const WmiSession&) = delete;
    auto operator=(const WmiSession&) -> WmiSession& = delete;

    [[nodiscard]] auto services() const -> IWbemServices* {
        return services_.get();
    }

    auto exec(const std::string& wql) -> ComPtr<IEnumWbemClassObject> {
        IEnumWbemClassObject* enumerator = nullptr;
        HRESULT hr = services_->ExecQuery(
            _bstr_t(L"WQL"), _bstr_t(wql.c_str()),
            WBEM_FLAG_FORWARD_ONLY | WBEM_FLAG_RETURN_IMMEDIATELY, nullptr,
            &enumerator);
        if (FAILED(hr)) {
            THROW_SYSTEM_ERROR("WMI query '", wql, "' failed: 0x", std::hex,
                               hr);
        }
        return ComPtr<IEnumWbemClassObject>(enumerator);
    }

private:
    // Uninitialize failures have nothing to report back to the caller.
    void uninitialize() noexcept {
        if (initialized_) {
            CoUninitialize();
            initialized_ = false;
        }
    }

    bool initialized_{false};
    ComPtr<IWbemLocator> locator_;
    ComPtr<IWbemServices> services_;
};

auto readStringProperty(IWbemClassObject* object, const std::string& name)
    -> std::optional<std::string> {
    VARIANT value;
    VariantInit(&value);
    std::wstring wname = utils::stringToWString(name);
    HRESULT hr = object->Get(wname.c_str(), 0, &value, nullptr, nullptr);
    std::optional<std::string> result;
    if (SUCCEEDED(hr) && value.vt == VT_BSTR) {
        result = bstrToString(value.bstrVal);
    }
    VariantClear(&value);
    return result;
}

class ComWmiQueryService : public WmiQueryService {
public:
    auto query(const std::string& wql,
               const std::vector<std::string>& properties)
        -> std::vector<WmiRow> override {
        WmiSession session;
        auto enumerator = session.exec(wql);

        std::vector<WmiRow> rows;
        while (true) {
            IWbemClassObject* object = nullptr;
            ULONG returned = 0;
            HRESULT hr =
                enumerator->Next(WBEM_INFINITE, 1, &object, &returned);
            if (FAILED(hr) || returned == 0) {
                break;
            }
            ComPtr<IWbemClassObject> holder(object);
            WmiRow row;
            for (const auto& property : properties) {
                if (auto value = readStringProperty(object, property)) {
                    row.emplace(property, std::move(*value));
                }
            }
            rows.push_back(std::move(row));
        }
        spdlog::debug("WMI '{}' returned {} objects", wql, rows.size());
        return rows;
    }

    auto usbDependentNames() -> std::vector<std::string> override {
        WmiSession session;
        auto enumerator =
            session.exec("SELECT Dependent FROM Win32_USBControllerDevice");

        std::vector<std::string> names;
        while (true) {
            IWbemClassObject* object = nullptr;
            ULONG returned = 0;
            HRESULT hr =
                enumerator->Next(WBEM_INFINITE, 1, &object, &returned);
            if (FAILED(hr) || returned == 0) {
                break;
            }
            ComPtr<IWbemClassObject> association(object);
            auto path = readStringProperty(object, "Dependent");
            if (!path || path->empty()) {
                continue;
            }

            IWbemClassObject* dependent = nullptr;
            std::wstring wpath = utils::stringToWString(*path);
            hr = session.services()->GetObject(_bstr_t(wpath.c_str()), 0,
                                               nullptr, &dependent, nullptr);
            if (FAILED(hr) || dependent == nullptr) {
                spdlog::debug("Could not resolve USB dependent {}", *path);
                continue;
            }
            ComPtr<IWbemClassObject> dependentHolder(dependent);
            if (auto name = readStringProperty(dependent, "Name")) {
                names.push_back(std::move(*name));
            }
        }
        return names;
    }
};

}  // namespace

auto createWmiQueryService() -> std::shared_ptr<WmiQueryService> {
    return std::make_shared<ComWmiQueryService>();
}

#else

auto createWmiQueryService() -> std::shared_ptr<WmiQueryService> {
    return nullptr;
}

#endif

}  // namespace airmon::system
