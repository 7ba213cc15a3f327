#include "planner.h"

#include "amount.h"

#include <cctype>
#include <cmath>
#include <limits>

using namespace std;

int sipPeriods(double years) {
    return static_cast<int>(floor(years * 12.0));
}

double sipMonthlyRate(double annualRatePct) {
    return annualRatePct / 100.0 / 12.0;
}

double sipGrowthFactor(double monthlyRate, int periods) {
    if (monthlyRate == 0.0) return static_cast<double>(periods);
    return ((pow(1.0 + monthlyRate, periods) - 1.0) / monthlyRate) * (1.0 + monthlyRate);
}

double sipFutureValue(double monthly, double annualRatePct, double years) {
    // nothing invested grows to nothing, even when the factor overflows
    if (monthly == 0.0) return 0.0;
    double r = sipMonthlyRate(annualRatePct);
    int n = sipPeriods(years);
    if (r == 0.0) return monthly * n;
    return monthly * sipGrowthFactor(r, n);
}

double sipRequiredMonthly(double goal, double annualRatePct, double years) {
    double r = sipMonthlyRate(annualRatePct);
    int n = sipPeriods(years);
    if (r == 0.0) return goal / n;
    return goal / sipGrowthFactor(r, n);
}

static inline bool isBlank(const string &s) {
    for (char c : s) if (!isspace((unsigned char)c)) return false;
    return true;
}

bool tryBuildSipPlan(const string &monthlyText, const string &rateText,
                     const string &yearsText, const string &goalText, SipPlan &out) {
    SipPlan plan;
    if (!tryParseNumber(monthlyText, plan.monthly)) return false;
    if (!tryParseNumber(rateText, plan.annualRatePct)) return false;
    if (!tryParseNumber(yearsText, plan.years)) return false;
    if (plan.monthly < 0.0 || plan.years <= 0.0) return false;
    if (plan.years * 12.0 >= static_cast<double>(numeric_limits<int>::max())) return false;

    // under a month gives zero periods and a corpus of 0
    plan.periods = sipPeriods(plan.years);
    plan.monthlyRate = sipMonthlyRate(plan.annualRatePct);
    plan.futureValue = sipFutureValue(plan.monthly, plan.annualRatePct, plan.years);

    if (!isBlank(goalText)) {
        if (!tryParseNumber(goalText, plan.goal)) return false;
        // no goal line when no contribution can reach it
        double factor = sipGrowthFactor(plan.monthlyRate, plan.periods);
        plan.hasGoal = factor != 0.0;
        if (plan.hasGoal) plan.requiredMonthly = sipRequiredMonthly(plan.goal, plan.annualRatePct, plan.years);
    }
    out = plan;
    return true;
}
