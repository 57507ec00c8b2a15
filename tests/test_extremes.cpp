///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_extremes.cpp
///	\author  ClimDiag Developers
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2026 ClimDiag Developers
///
///		This file is distributed as part of the ClimDiag source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#include "SyntheticGrids.h"

#include "ExceedanceFrequency.h"
#include "ExtremeStatisticsEngine.h"
#include "PercentileThreshold.h"
#include "PipelineError.h"

#include <limits>
#include <vector>

namespace
{

const char * const TestName = "extremes";

///	<summary>
///		Writer that keeps the artifacts in memory.
///	</summary>
class RecordingArtifactWriter : public ArtifactWriter {

public:
	virtual void WriteThresholdField(
		const PercentileThresholdField & field
	) {
		m_vecThresholdNames.push_back(field.GetKey().GetBaseName());
	}

	virtual void WriteExceedanceSeries(
		const ExceedanceSeries & series
	) {
		m_vecSeries.push_back(series);
	}

	virtual void WriteClimateIndexSeries(
		const ClimateIndexSeries & series
	) {
		m_nIndexSeries++;
	}

public:
	RecordingArtifactWriter() :
		m_nIndexSeries(0)
	{ }

	std::vector<std::string> m_vecThresholdNames;

	std::vector<ExceedanceSeries> m_vecSeries;

	int m_nIndexSeries;
};

///	<summary>
///		Daily precipitation over 2 x 3 cells in which every cell holds a
///		permutation of 1 .. n over each block of n days starting at
///		iBlockStartYear.  Days outside the block hold 0.5.
///	</summary>
void make_permutation_grid(
	int iFirstYear,
	int nYears,
	int iBlockStartYear,
	int nBlockYears,
	TimeSeriesGrid & grid
) {
	NcTimeDimension vecTime;
	make_daily_axis(iFirstYear, nYears, vecTime);

	DataArray1D<double> dLat;
	DataArray1D<double> dLon;
	make_axis(-10.0, 20.0, 2, dLat);
	make_axis(100.0, 5.0, 3, dLon);

	grid.Initialize("pr", "mm day-1", vecTime, dLat, dLon);

	const long lBlockDays = 365L * static_cast<long>(nBlockYears);
	const long lBlockStart = 365L * static_cast<long>(iBlockStartYear - iFirstYear);

	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		long d = static_cast<long>(t) - lBlockStart;
		for (size_t j = 0; j < 2; j++) {
		for (size_t i = 0; i < 3; i++) {
			if ((d < 0) || (d >= lBlockDays)) {
				grid.m_data(t,j,i) = 0.5f;
				continue;
			}
			long c = static_cast<long>(3 * j + i);
			long r = (d * 7919L + c * 101L) % lBlockDays;
			grid.m_data(t,j,i) = static_cast<float>(r + 1);
		}
		}
	}
}

int test_percentile_is_exact_order_statistic()
{
	int failures = 0;

	TimeSeriesGrid grid;
	make_permutation_grid(1980, 35, 1980, 35, grid);

	const int nSamples = 365 * 35;
	const double dLevels[3] = { 50.0, 99.0, 99.9 };

	for (int l = 0; l < 3; l++) {
		DataArray2D<double> dThreshold;
		DataArray2D<int> nCount;
		ComputePercentileThreshold(
			grid, dLevels[l], PercentileEstimatorOptions(), dThreshold, nCount);

		double dExpected =
			static_cast<double>(PercentileRank(nSamples, dLevels[l]) + 1);

		bool fExact = true;
		bool fCounts = true;
		for (size_t j = 0; j < 2; j++) {
		for (size_t i = 0; i < 3; i++) {
			if (!nearly_equal(dThreshold(j,i), dExpected)) {
				fExact = false;
			}
			if (nCount(j,i) != nSamples) {
				fCounts = false;
			}
		}
		}
		failures += expect_true(TestName, fExact,
			"threshold must equal the order statistic of the target rank");
		failures += expect_true(TestName, fCounts,
			"sample count must equal the number of valid samples");
	}

	// Few iterations still converge through the snap passes
	PercentileEstimatorOptions opts;
	opts.m_nBins = 2;
	opts.m_nIterations = 1;

	DataArray2D<double> dThreshold;
	DataArray2D<int> nCount;
	ComputePercentileThreshold(grid, 99.0, opts, dThreshold, nCount);
	failures += expect_true(TestName,
		nearly_equal(dThreshold(1,2),
			static_cast<double>(PercentileRank(nSamples, 99.0) + 1)),
		"coarse estimator settings must still give the exact order statistic");

	return failures;
}

int test_missing_cells_and_degeneracy()
{
	int failures = 0;

	TimeSeriesGrid grid;
	make_permutation_grid(1980, 2, 1980, 2, grid);
	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		grid.m_data(t,0,0) = std::numeric_limits<float>::quiet_NaN();
	}

	DataArray2D<double> dThreshold;
	DataArray2D<int> nCount;
	ComputePercentileThreshold(
		grid, 99.0, PercentileEstimatorOptions(), dThreshold, nCount);

	failures += expect_true(TestName,
		(dThreshold(0,0) != dThreshold(0,0)) && (nCount(0,0) == 0),
		"a cell without samples must have a missing threshold");
	failures += expect_true(TestName, dThreshold(1,1) == dThreshold(1,1),
		"cells with samples must have a threshold");

	for (size_t t = 0; t < grid.GetTimeCount(); t++) {
		grid.m_data(t,0,1) = 2.0f;
	}

	int iKind = -1;
	try {
		ComputePercentileThreshold(
			grid, 99.0, PercentileEstimatorOptions(), dThreshold, nCount);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_ThresholdDegeneracy,
		"a constant cell must raise a threshold degeneracy error");

	iKind = -1;
	try {
		ComputePercentileThreshold(
			grid, 100.0, PercentileEstimatorOptions(), dThreshold, nCount);
	} catch(PipelineError & e) {
		iKind = e.GetKind();
	}
	failures += expect_true(TestName, iKind == PipelineErrorKind_Configuration,
		"a percentile level of 100 must raise a configuration error");

	return failures;
}

int test_engine_reference_and_exceedance()
{
	int failures = 0;

	// 1950-2014 historical with the permutation block on the reference years
	TimeSeriesGrid grid;
	make_permutation_grid(1950, 65, 1980, 35, grid);

	RecordingArtifactWriter writer;

	ExtremeStatisticsEngine engine99("r1", 99.0, YearRange(1980, 2014), writer);
	ExtremeStatisticsEngine engine999("r1", 99.9, YearRange(1980, 2014), writer);

	failures += expect_true(TestName,
		engine99.GetState() == ExtremeStatisticsEngine::State_Reference,
		"a new engine must wait for the reference threshold");

	engine99.ComputeReference(grid);
	engine999.ComputeReference(grid);

	failures += expect_true(TestName,
		engine99.GetState() == ExtremeStatisticsEngine::State_Exceedance,
		"the engine must accept exceedance requests after the reference");
	failures += expect_true(TestName,
		(writer.m_vecThresholdNames.size() == 2) &&
		(writer.m_vecThresholdNames[0] == "r1_pr_threshold_p99_ref_1980-2014") &&
		(writer.m_vecThresholdNames[1] == "r1_pr_threshold_p99.9_ref_1980-2014"),
		"each threshold must be persisted under its key");

	const PercentileThresholdField & field99 = engine99.GetThresholdField();
	const PercentileThresholdField & field999 = engine999.GetThresholdField();
	bool fOrdered = true;
	for (size_t j = 0; j < 2; j++) {
	for (size_t i = 0; i < 3; i++) {
		if (field999.m_dThreshold(j,i) < field99.m_dThreshold(j,i)) {
			fOrdered = false;
		}
	}
	}
	failures += expect_true(TestName, fOrdered,
		"the p99.9 threshold must not be below the p99 threshold");

	// Reference period exceeds its own p99 threshold about 1% of the time
	ExceedanceSeries series;
	engine99.ComputeExceedance(
		grid,
		AnalysisPeriod("historical", YearRange(1980, 2014)),
		ExceedanceGranularity_Annual,
		series);

	failures += expect_true(TestName, series.m_vecEntries.size() == 35,
		"the annual series must hold one entry per year");

	double dMeanFrequency = 0.0;
	double dMeanDays = 0.0;
	for (size_t e = 0; e < series.m_vecEntries.size(); e++) {
		dMeanFrequency += series.m_vecEntries[e].m_dFrequency;
		dMeanDays += series.m_vecEntries[e].m_dDays;
	}
	dMeanFrequency /= static_cast<double>(series.m_vecEntries.size());
	dMeanDays /= static_cast<double>(series.m_vecEntries.size());

	const int nSamples = 365 * 35;
	double dExpectedDays =
		static_cast<double>(nSamples - PercentileRank(nSamples, 99.0))
		/ 35.0;

	failures += expect_true(TestName,
		nearly_equal(dMeanFrequency, 0.01, 0.001),
		"self-exceedance frequency over the reference period must be near 1%");
	failures += expect_true(TestName,
		nearly_equal(dMeanDays, dExpectedDays, 1.0e-9),
		"mean exceedance days must match the number of samples above the rank");
	failures += expect_true(TestName,
		(dMeanDays > 3.6) && (dMeanDays < 4.0),
		"about 3.65 exceedance days per year are expected at p99");

	// Outside the permutation block nothing exceeds the threshold
	ExceedanceSeries seriesEarly;
	engine99.ComputeExceedance(
		grid,
		AnalysisPeriod("early", YearRange(1950, 1979)),
		ExceedanceGranularity_Annual,
		seriesEarly);
	failures += expect_true(TestName,
		(seriesEarly.m_vecEntries.size() == 30) &&
		nearly_equal(seriesEarly.m_vecEntries[0].m_dDays, 0.0),
		"low values must never exceed the threshold");

	// Monthly series
	ExceedanceSeries seriesMonthly;
	engine99.ComputeExceedance(
		grid,
		AnalysisPeriod("decade", YearRange(2001, 2010)),
		ExceedanceGranularity_Monthly,
		seriesMonthly);
	failures += expect_true(TestName, seriesMonthly.m_vecEntries.size() == 120,
		"the monthly series must hold one entry per month");
	failures += expect_true(TestName,
		(seriesMonthly.m_vecEntries[13].m_iYear == 2002) &&
		(seriesMonthly.m_vecEntries[13].m_iMonth == 2) &&
		(seriesMonthly.m_vecEntries[13].m_timeStart.GetDay() == 1),
		"monthly entries must start on the first of their month");
	failures += expect_true(TestName,
		seriesMonthly.GetKey().GetBaseName()
			== "r1_pr_exceedance_monthly_p99_decade_2001-2010",
		"monthly series must be named by their key");

	failures += expect_true(TestName, writer.m_vecSeries.size() == 3,
		"every exceedance series must be persisted");

	return failures;
}

int test_engine_order_and_reference_checks()
{
	int failures = 0;

	RecordingArtifactWriter writer;

	TimeSeriesGrid grid;
	make_permutation_grid(1990, 25, 1990, 25, grid);

	// Exceedance before reference
	{
		ExtremeStatisticsEngine engine("r2", 99.0, YearRange(1990, 2014), writer);

		bool fThrown = false;
		try {
			ExceedanceSeries series;
			engine.ComputeExceedance(
				grid,
				AnalysisPeriod("historical", YearRange(1990, 2014)),
				ExceedanceGranularity_Annual,
				series);
		} catch(Exception & e) {
			fThrown = true;
		}
		failures += expect_true(TestName, fThrown,
			"exceedance before the reference threshold must be rejected");
		failures += expect_true(TestName, writer.m_vecSeries.size() == 0,
			"a rejected exceedance request must not persist anything");
	}

	// Reference period longer than the data
	{
		ExtremeStatisticsEngine engine("r2", 99.0, YearRange(1980, 2014), writer);

		int iKind = -1;
		try {
			engine.ComputeReference(grid);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName,
			iKind == PipelineErrorKind_InsufficientReferenceData,
			"missing reference years must raise an insufficient reference error");
		failures += expect_true(TestName,
			engine.GetState() == ExtremeStatisticsEngine::State_Reference,
			"a failed reference must leave the engine waiting for the reference");
		failures += expect_true(TestName, writer.m_vecThresholdNames.size() == 0,
			"a failed reference must not persist a threshold");
	}

	// Reference period ending after January of its last year
	{
		const size_t sTimes = 24 * 365 + 31;

		NcTimeDimension vecTime;
		for (size_t t = 0; t < sTimes; t++) {
			vecTime.push_back(grid.m_vecTime[t]);
		}

		TimeSeriesGrid gridShort;
		gridShort.Initialize(
			grid.m_strVariableName, grid.m_strUnits, vecTime, grid.m_dLat, grid.m_dLon);
		for (size_t t = 0; t < sTimes; t++) {
			for (size_t j = 0; j < 2; j++) {
			for (size_t i = 0; i < 3; i++) {
				gridShort.m_data(t,j,i) = grid.m_data(t,j,i);
			}
			}
		}

		ExtremeStatisticsEngine engine("r2", 99.0, YearRange(1990, 2014), writer);

		int iKind = -1;
		try {
			engine.ComputeReference(gridShort);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName,
			iKind == PipelineErrorKind_InsufficientReferenceData,
			"a partially covered reference year must raise an insufficient reference error");
		failures += expect_true(TestName, writer.m_vecThresholdNames.size() == 0,
			"a partially covered reference must not persist a threshold");
	}

	// Exceedance grid must have the reference threshold coordinates
	{
		ExtremeStatisticsEngine engine("r2", 99.0, YearRange(1990, 2014), writer);
		engine.ComputeReference(grid);

		TimeSeriesGrid gridShifted = grid;
		for (size_t i = 0; i < gridShifted.GetLonCount(); i++) {
			gridShifted.m_dLon[i] += 2.5;
		}

		int iKind = -1;
		try {
			ExceedanceSeries series;
			engine.ComputeExceedance(
				gridShifted,
				AnalysisPeriod("historical", YearRange(1990, 2014)),
				ExceedanceGranularity_Annual,
				series);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Input,
			"a grid of the same shape at other coordinates must be rejected");
	}

	// Exceedance series must be in the threshold units
	{
		ExtremeStatisticsEngine engine("r2", 99.0, YearRange(1990, 2014), writer);
		engine.ComputeReference(grid);

		TimeSeriesGrid gridFlux = grid;
		gridFlux.m_strUnits = "kg m-2 s-1";

		int iKind = -1;
		try {
			ExceedanceSeries series;
			engine.ComputeExceedance(
				gridFlux,
				AnalysisPeriod("historical", YearRange(1990, 2014)),
				ExceedanceGranularity_Annual,
				series);
		} catch(PipelineError & e) {
			iKind = e.GetKind();
		}
		failures += expect_true(TestName, iKind == PipelineErrorKind_Units,
			"data in other units than the threshold must raise a units error");
	}

	return failures;
}

}

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

	int failures = 0;

	try {
		failures += test_percentile_is_exact_order_statistic();
		failures += test_missing_cells_and_degeneracy();
		failures += test_engine_reference_and_exceedance();
		failures += test_engine_order_and_reference_checks();

	} catch(Exception & e) {
		std::cerr << "[" << TestName << "] unexpected exception: "
			<< e.ToString() << std::endl;
		failures++;
	}

	return report(TestName, failures);
}

///////////////////////////////////////////////////////////////////////////////
