#include <envsense/sensors/weather.hpp>

#include <envsense/core/log.hpp>
#include <envsense/platform/file_reader.hpp>

#include <nlohmann/json.hpp>

namespace envsense {

namespace {

using json = nlohmann::json;

Error ParseFailure(const std::string& detail) {
    return Error{"Weather", "Failed to parse weather data", ErrorCategory::Io, detail};
}

// wttr.in encodes every number as a string.
int IntField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (it->is_number()) return it->get<int>();
    if (!it->is_string()) return 0;
    try {
        return std::stoi(it->get<std::string>());
    } catch (const std::exception&) {
        return 0;
    }
}

double DoubleField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0.0;
    if (it->is_number()) return it->get<double>();
    if (!it->is_string()) return 0.0;
    try {
        return std::stod(it->get<std::string>());
    } catch (const std::exception&) {
        return 0.0;
    }
}

std::string StringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// [{"value": "Sunny"}]
std::string ValueListField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array() || it->empty()) return "";
    const auto& first = it->front();
    if (!first.is_object()) return "";
    return StringField(first, "value");
}

ForecastHour ParseHour(const json& hourly) {
    ForecastHour hour;
    // "time" is hhmm without padding: "0", "300", "1200".
    hour.hour = IntField(hourly, "time") / 100;
    hour.temp_f = IntField(hourly, "tempF");
    hour.temp_c = IntField(hourly, "tempC");
    hour.conditions = Trim(ValueListField(hourly, "weatherDesc"));
    hour.chance_of_rain = IntField(hourly, "chanceofrain");
    return hour;
}

} // anonymous namespace

std::string WeatherArea::Display() const {
    std::string out;
    for (const auto* part : {&name, &region, &country}) {
        if (part->empty()) continue;
        if (!out.empty()) out += ", ";
        out += *part;
    }
    return out;
}

Result<WeatherReport, Error> ParseWttrReport(const std::string& body,
                                             const std::string& location) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        return Result<WeatherReport, Error>::Err(ParseFailure(e.what()));
    }
    if (!doc.is_object()) {
        return Result<WeatherReport, Error>::Err(ParseFailure("response is not an object"));
    }

    auto current_it = doc.find("current_condition");
    if (current_it == doc.end() || !current_it->is_array() || current_it->empty() ||
        !current_it->front().is_object()) {
        return Result<WeatherReport, Error>::Err(ParseFailure("missing current_condition"));
    }

    WeatherReport report;
    report.location = location;

    const auto& cur = current_it->front();
    auto& current = report.current;
    current.conditions = Trim(ValueListField(cur, "weatherDesc"));
    current.temperature_f = IntField(cur, "temp_F");
    current.temperature_c = IntField(cur, "temp_C");
    current.feels_like_f = IntField(cur, "FeelsLikeF");
    current.feels_like_c = IntField(cur, "FeelsLikeC");
    current.humidity_percent = IntField(cur, "humidity");
    current.wind_mph = IntField(cur, "windspeedMiles");
    current.wind_kmph = IntField(cur, "windspeedKmph");
    current.wind_direction = StringField(cur, "winddir16Point");
    current.visibility_miles = IntField(cur, "visibilityMiles");
    current.pressure_mb = IntField(cur, "pressure");
    current.uv_index = IntField(cur, "uvIndex");
    current.precipitation_mm = DoubleField(cur, "precipMM");

    if (auto area_it = doc.find("nearest_area");
        area_it != doc.end() && area_it->is_array() && !area_it->empty() &&
        area_it->front().is_object()) {
        const auto& a = area_it->front();
        WeatherArea area{ValueListField(a, "areaName"), ValueListField(a, "region"),
                         ValueListField(a, "country")};
        if (!area.Display().empty()) report.area = std::move(area);
    }

    if (auto weather_it = doc.find("weather");
        weather_it != doc.end() && weather_it->is_array()) {
        for (const auto& day_json : *weather_it) {
            if (!day_json.is_object()) continue;
            ForecastDay day;
            day.date = StringField(day_json, "date");
            day.max_f = IntField(day_json, "maxtempF");
            day.max_c = IntField(day_json, "maxtempC");
            day.min_f = IntField(day_json, "mintempF");
            day.min_c = IntField(day_json, "mintempC");

            auto hourly_it = day_json.find("hourly");
            if (hourly_it != day_json.end() && hourly_it->is_array()) {
                // Three-hourly data; keep every third slot (00:00, 09:00, 18:00).
                for (size_t i = 0; i < hourly_it->size(); i += 3) {
                    const auto& hourly = (*hourly_it)[i];
                    if (hourly.is_object()) day.hours.push_back(ParseHour(hourly));
                }
            }
            report.days.push_back(std::move(day));
        }
    }

    return Result<WeatherReport, Error>::Ok(std::move(report));
}

WttrWeatherSource::WttrWeatherSource(IHttpClient& http) : http_(http) {}

Result<WeatherReport, Error> WttrWeatherSource::Fetch(const std::string& location) {
    const std::string path = "/" + UrlEncode(location) + "?format=j1";
    auto response = http_.Get(path, {{"Accept", "application/json"}});
    if (response.IsErr()) {
        return Result<WeatherReport, Error>::Err(std::move(response).Error());
    }

    const auto& res = response.Value();
    if (!res.IsSuccess()) {
        LogWarn("weather", "wttr.in returned HTTP " + std::to_string(res.status_code) +
                               " for '" + location + "'");
        return Result<WeatherReport, Error>::Err(Error{
            "Weather", "Weather service returned HTTP " + std::to_string(res.status_code),
            ErrorCategory::Network, path});
    }
    return ParseWttrReport(res.body, location);
}

} // namespace envsense
