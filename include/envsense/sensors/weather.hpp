#pragma once

#include <envsense/core/result.hpp>
#include <envsense/platform/http_client.hpp>

#include <optional>
#include <string>
#include <vector>

namespace envsense {

struct WeatherArea {
    std::string name;
    std::string region;
    std::string country;

    // "Berlin, Berlin, Germany" with empty parts dropped.
    [[nodiscard]] std::string Display() const;
};

struct CurrentWeather {
    std::string conditions;
    int temperature_f = 0;
    int temperature_c = 0;
    int feels_like_f = 0;
    int feels_like_c = 0;
    int humidity_percent = 0;
    int wind_mph = 0;
    int wind_kmph = 0;
    std::string wind_direction;
    int visibility_miles = 0;
    int pressure_mb = 0;
    int uv_index = 0;
    double precipitation_mm = 0.0;
};

struct ForecastHour {
    int hour = 0;  // 0..23
    int temp_f = 0;
    int temp_c = 0;
    std::string conditions;
    int chance_of_rain = 0;
};

struct ForecastDay {
    std::string date;
    int max_f = 0;
    int max_c = 0;
    int min_f = 0;
    int min_c = 0;
    std::vector<ForecastHour> hours;
};

struct WeatherReport {
    std::string location;  // as requested
    std::optional<WeatherArea> area;
    CurrentWeather current;
    std::vector<ForecastDay> days;
};

// wttr.in `?format=j1` body. Failures are Io ("Failed to parse weather data").
[[nodiscard]] Result<WeatherReport, Error> ParseWttrReport(const std::string& body,
                                                           const std::string& location);

class IWeatherSource {
public:
    virtual ~IWeatherSource() = default;
    [[nodiscard]] virtual Result<WeatherReport, Error> Fetch(const std::string& location) = 0;
};

// ---------------------------------------------------------------------------
// WttrWeatherSource: GET /<location>?format=j1 on the configured client.
// ---------------------------------------------------------------------------
class WttrWeatherSource : public IWeatherSource {
public:
    explicit WttrWeatherSource(IHttpClient& http);

    [[nodiscard]] Result<WeatherReport, Error> Fetch(const std::string& location) override;

private:
    IHttpClient& http_;
};

} // namespace envsense
