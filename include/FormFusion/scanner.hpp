#pragma once

#include <concepts>
#include <expected>
#include <string>

#include "form_value.hpp"

namespace FormFusion {

using ScanResult = std::expected<void, std::string>;

// Attach a scanner to a type you cannot edit:
//
//   template<> struct FormFusion::FormScanner<Date> {
//       static ScanResult scan(Date & d, const FormValue & v);
//   };
template<class T>
struct FormScanner;

template<class T>
concept MemberFormScannable = requires(T & t, const FormValue & v) {
    { t.form_scan(v) } -> std::same_as<ScanResult>;
};

template<class T>
concept ExternalFormScannable = requires(T & t, const FormValue & v) {
    { FormScanner<T>::scan(t, v) } -> std::same_as<ScanResult>;
};

// Types that convert raw form input themselves. They receive the entry
// untouched and own the whole conversion.
template<class T>
concept FormScannable = MemberFormScannable<T> || ExternalFormScannable<T>;

template<FormScannable T>
ScanResult Scan(T & target, const FormValue & value) {
    if constexpr (ExternalFormScannable<T>) {
        return FormScanner<T>::scan(target, value);
    } else {
        return target.form_scan(value);
    }
}

} // namespace FormFusion
