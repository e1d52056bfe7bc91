// Types FormFusion cannot reflect or parse on its own: a field list
// registered through StructMeta, and a scanner attached from outside.

#include <FormFusion/formfusion.hpp>
#include <absl/time/civil_time.h>
#include <iostream>

using namespace FormFusion;

// Non-aggregate: pfr cannot see its members
class Range {
public:
    Range() : lo_(0), hi_(100) {}
    int lo() const { return lo_; }
    int hi() const { return hi_; }

    int lo_;
    int hi_;
};

template<> struct FormFusion::StructMeta<Range> {
    using Fields = StructFields<
        Field<&Range::lo_, "Lo", options::form<"min">>,
        Field<&Range::hi_, "Hi", options::form<"max">>
    >;
};

struct Day {
    absl::CivilDay value;
};

template<> struct FormFusion::FormScanner<Day> {
    static ScanResult scan(Day & d, const FormValue & v) {
        const std::string * s = std::get_if<std::string>(&v);
        if (!s || !absl::ParseCivilTime(*s, &d.value)) {
            return std::unexpected(std::string("expected a YYYY-MM-DD date"));
        }
        return {};
    }
};

struct Holiday {
    std::string Name;
    Day When;
};

int main() {
    Range r;
    if (auto res = BodyParser(r, "application/x-www-form-urlencoded", "min=5&max=50"); !res) {
        std::cout << DecodeResultToString(res) << std::endl;
        return 1;
    }
    std::cout << "range: [" << r.lo() << ", " << r.hi() << "]" << std::endl;
    /* range: [5, 50] */

    Holiday h;
    if (auto res = BodyParser(h, "application/x-www-form-urlencoded", "name=Ada+Lovelace+Day&when=2024-10-08"); !res) {
        std::cout << DecodeResultToString(res) << std::endl;
        return 1;
    }
    std::cout << h.Name << ": " << h.When.value << std::endl;
    /* Ada Lovelace Day: 2024-10-08 */

    auto res = BodyParser(h, "application/x-www-form-urlencoded", "when=tomorrow");
    std::cout << DecodeResultToString(res) << std::endl;
    /* BodyParser error: field="When" kind=parse_error, err=expected a YYYY-MM-DD date */
}
